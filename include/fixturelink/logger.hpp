/**
 * @page fl-logger fixturelink Logger
 * @file logger.hpp
 * @brief Injected, line-oriented logger for link components.
 *
 * @details
 * PURPOSE
 * -------
 * Every component (synchronizer, stream buffer, connection manager, control
 * loop) takes a `Logger&` in its constructor. Nothing in the library writes to
 * std::cout/std::cerr directly and nothing replaces process-wide streams, so a
 * test can hand each component its own `std::ostringstream` and inspect what
 * that component said.
 *
 * FORMAT
 * ------
 * One event per line, key=value, easy to grep on a bench PC:
 *
 *   level=warn comp=link:fixture msg="handshake attempt 2/15 timed out"
 *
 * THREADING
 * ---------
 * Lines are written under a mutex shared by all loggers that target the same
 * sink, so reader threads and control loops never interleave characters.
 */
#ifndef FIXTURELINK_LOGGER_HPP
#define FIXTURELINK_LOGGER_HPP

#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace fixturelink {

class Logger {
public:
  enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

  /// Root logger writing to @p sink. The sink must outlive every logger derived from it.
  explicit Logger(std::ostream& sink, Level min_level = Level::Info, std::string component = "fixturelink");

  /// Child logger that shares this logger's sink and lock but reports another component.
  Logger child(const std::string& component) const;

  void log(Level level, const std::string& msg) const;
  void debug(const std::string& msg) const { log(Level::Debug, msg); }
  void info (const std::string& msg) const { log(Level::Info,  msg); }
  void warn (const std::string& msg) const { log(Level::Warn,  msg); }
  void error(const std::string& msg) const { log(Level::Error, msg); }

  bool enabled(Level level) const { return sink_ && level >= min_level_ && min_level_ != Level::Off; }
  Level min_level() const { return min_level_; }
  const std::string& component() const { return component_; }

  /// Logger that drops everything. Shared, safe to use from any thread.
  static Logger& null();

  static const char* level_name(Level level);
  static bool parse_level(const std::string& name, Level& out);

private:
  Logger(std::ostream* sink, std::shared_ptr<std::mutex> lock, Level min_level, std::string component);

  std::ostream* sink_;
  std::shared_ptr<std::mutex> lock_;
  Level min_level_;
  std::string component_;
};

} // namespace fixturelink

#endif // FIXTURELINK_LOGGER_HPP
