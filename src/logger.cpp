// ============================================================================
// logger.cpp — implementation for logger.hpp
// ============================================================================

#include "fixturelink/logger.hpp"
#include "fixturelink/errors.hpp"

namespace fixturelink {

Logger::Logger(std::ostream& sink, Level min_level, std::string component)
: Logger(&sink, std::make_shared<std::mutex>(), min_level, std::move(component)) {}

Logger::Logger(std::ostream* sink, std::shared_ptr<std::mutex> lock, Level min_level, std::string component)
: sink_(sink), lock_(std::move(lock)), min_level_(min_level), component_(std::move(component)) {}

Logger Logger::child(const std::string& component) const {
  return Logger(sink_, lock_, min_level_, component);
}

// ---------------------------------------------------------------------------
// log()
// -----
// Quotes the message so spaces survive `cut`/`awk` style parsing. Embedded
// double quotes are escaped; newlines are flattened to keep one event per line.
// ---------------------------------------------------------------------------
void Logger::log(Level level, const std::string& msg) const {
  if (!enabled(level)) return;

  std::string quoted;
  quoted.reserve(msg.size() + 2);
  quoted.push_back('"');
  for (char c : msg) {
    if (c == '"')       quoted += "\\\"";
    else if (c == '\n') quoted.push_back(' ');
    else                quoted.push_back(c);
  }
  quoted.push_back('"');

  std::lock_guard<std::mutex> guard(*lock_);
  (*sink_) << "level=" << level_name(level)
           << " comp=" << component_
           << " msg=" << quoted << "\n";
  sink_->flush();
}

Logger& Logger::null() {
  static Logger silent(nullptr, std::make_shared<std::mutex>(), Level::Off, "null");
  return silent;
}

const char* Logger::level_name(Level level) {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "unknown";
}

bool Logger::parse_level(const std::string& name, Level& out) {
  if      (name == "debug") out = Level::Debug;
  else if (name == "info")  out = Level::Info;
  else if (name == "warn")  out = Level::Warn;
  else if (name == "error") out = Level::Error;
  else if (name == "off")   out = Level::Off;
  else return false;
  return true;
}

// ---------------------------------------------------------------------------
// Status names, used in log lines and by the CLI's "status=error reason=..."
// ---------------------------------------------------------------------------
const char* to_string(LinkStatus s) {
  switch (s) {
    case LinkStatus::Ok:            return "ok";
    case LinkStatus::Timeout:       return "timeout";
    case LinkStatus::ConnectFailed: return "connect_failed";
    case LinkStatus::NotConnected:  return "not_connected";
    case LinkStatus::Faulted:       return "faulted";
    case LinkStatus::IoError:       return "io_error";
    case LinkStatus::Cancelled:     return "cancelled";
  }
  return "unknown";
}

const char* to_string(IoStatus s) {
  switch (s) {
    case IoStatus::Ok:        return "ok";
    case IoStatus::Timeout:   return "timeout";
    case IoStatus::Cancelled: return "cancelled";
    case IoStatus::Error:     return "error";
  }
  return "unknown";
}

} // namespace fixturelink
