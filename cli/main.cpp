/**
 * @file main.cpp
 * @brief fixturelink-cli: one-shot request/response against a configured channel.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and resolve the channel, either from a JSON
 *    channels file (--config) or from a built-in profile preset.
 *  - Connect the channel (handshake included) and, unless --probe, send one
 *    message built from --type and repeated --set name=value.
 *  - Decode the reply with the profile's message table and print it as
 *    pretty text or JSON (nlohmann).
 *
 * Exit codes:
 *  - 0 ok, 1 I/O or link failure, 2 usage/config, 3 reply timeout, 4 connect failed.
 *
 * Notes:
 *  - Profiles "fixture" and "safety" have message tables; "vcu" bodies are
 *    raw hex (--body) with an explicit --format-id.
 *  - Logs go to stderr; results go to stdout.
 */

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "fixturelink/channel_config.hpp"
#include "fixturelink/connection.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/frame.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/message_codec.hpp"
#include "fixturelink/message_registry.hpp"
#include "fixturelink/protocols/fixture_messages.hpp"
#include "fixturelink/protocols/safety_messages.hpp"
#include "fixturelink/protocols/vcu_messages.hpp"

using json = nlohmann::json;
using namespace fixturelink;

namespace {

enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_IO = 1,
  EXIT_USAGE = 2,
  EXIT_TIMEOUT = 3,
  EXIT_CONNECT = 4,
};

CancelToken g_cancel;

void on_signal(int) { g_cancel.cancel(); }

// ---------- small utilities ----------

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

/// Message table the profile's requests are looked up in, or nullptr (vcu).
const MessageRegistry* request_table(const std::string& profile) {
  if (profile == "fixture") return &fixture::registry();
  if (profile == "safety")  return &safety::requests();
  return nullptr;
}

/// Request descriptor by name or numeric code. Transport descriptors (negative codes) are not sendable.
const MessageDescriptor* find_request(const MessageRegistry& table, const std::string& type) {
  for (int32_t code : table.type_codes()) {
    const MessageDescriptor* d = table.find(code);
    if (code < 0 || !d) continue;
    if (type == d->name.c_str() || type == std::to_string(code)) return d;
  }
  return nullptr;
}

const MessageDescriptor* find_reply(const std::string& profile, const Frame& f) {
  if (profile == "fixture") return fixture::registry().find(f.format_id);
  if (profile == "safety")  return safety::response_for_body(f.body);
  return nullptr;
}

/// Apply one "name=value" to @p msg; throws std::invalid_argument / std::out_of_range / EncodingError.
void apply_assignment(Message& msg, const std::string& assignment) {
  const auto eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) throw std::invalid_argument("expected name=value, got '" + assignment + "'");
  const std::string name = assignment.substr(0, eq);
  const std::string text = assignment.substr(eq + 1);

  const int idx = msg.descriptor().index_of(name.c_str());
  if (idx < 0) throw std::invalid_argument("no field '" + name + "' in " + msg.descriptor().name.c_str());
  const FieldKind kind = msg.descriptor().fields[static_cast<size_t>(idx)].kind;

  if (field_is_real(kind))        msg.set(name.c_str(), std::stod(text));
  else if (field_is_signed(kind)) msg.set(name.c_str(), static_cast<int64_t>(std::stoll(text, nullptr, 0)));
  else                            msg.set(name.c_str(), static_cast<uint64_t>(std::stoull(text, nullptr, 0)));
}

json fields_json(const Message& m) {
  json j = json::object();
  const MessageDescriptor& d = m.descriptor();
  for (size_t i = 0; i < d.fields.size(); ++i) {
    std::visit([&](auto v) { j[d.fields[i].name.c_str()] = v; }, m.values()[i]);
  }
  return j;
}

void print_failure(const std::string& format, const Ansi& ansi, const char* status, const std::string& reason) {
  if (format == "json") {
    json j;
    j["status"] = status;
    j["reason"] = reason;
    std::cout << j.dump(2) << "\n";
  }
  std::cerr << ansi.red(std::string("status=") + status + " reason=" + reason) << "\n";
}

int exit_for(LinkStatus st) {
  switch (st) {
    case LinkStatus::Ok:            return EXIT_OK;
    case LinkStatus::Timeout:       return EXIT_TIMEOUT;
    case LinkStatus::ConnectFailed: return EXIT_CONNECT;
    default:                        return EXIT_IO;
  }
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_channel;
  std::string opt_device;
  std::string opt_host;
  std::string opt_type;
  std::vector<std::string> opt_set;
  std::string opt_body_hex;
  int32_t opt_format_id = vcu::MESSAGE_FORMAT_C_STRUCT;
  int opt_timeout_ms = -1; // -1 => channel's recv_timeout_ms
  bool opt_probe = false;
  std::string opt_format = "pretty"; // pretty|json
  std::string opt_log_level = "warn";
  bool opt_no_color = false;

  CLI::App app{"fixturelink CLI: send one message to a test fixture channel"};

  app.add_option("--config", opt_config, "JSON channels file");
  app.add_option("--channel", opt_channel, "Channel name (from --config) or profile: safety|fixture|vcu")->required();
  app.add_option("--device", opt_device, "Serial device for a profile preset");
  app.add_option("--host", opt_host, "Host for the vcu profile preset");
  app.add_option("--type", opt_type, "Message type name or code");
  app.add_option("--set", opt_set, "Field assignment name=value (repeatable)");
  app.add_option("--body", opt_body_hex, "Raw body as hex (vcu profile)");
  app.add_option("--format-id", opt_format_id, "Frame format id for a raw body")->capture_default_str();
  app.add_option("--timeout", opt_timeout_ms, "Reply timeout in ms")->check(CLI::Range(1, 600000));
  app.add_flag("--probe", opt_probe, "Only connect (run the handshake) and report");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")->capture_default_str();
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? EXIT_OK : EXIT_USAGE;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  Logger::Level level = Logger::Level::Warn;
  if (!Logger::parse_level(opt_log_level, level)) {
    std::cerr << ansi.red("error: unknown --log-level '" + opt_log_level + "'") << "\n";
    return EXIT_USAGE;
  }
  Logger log(std::cerr, level, "cli");

  // Resolve the channel
  ChannelConfig cfg;
  try {
    if (!opt_config.empty()) {
      bool found = false;
      for (const auto& c : load_channel_configs(opt_config)) {
        if (c.name == opt_channel) { cfg = c; found = true; break; }
      }
      if (!found) throw ConfigError("no channel '" + opt_channel + "' in " + opt_config);
    } else {
      cfg = preset(opt_channel);
      if (!opt_device.empty()) cfg.serial.path = opt_device;
      if (!opt_host.empty())   cfg.udp.host = opt_host;
      if (cfg.link == LinkKind::Serial && cfg.serial.path.empty())
        throw ConfigError("profile '" + cfg.profile + "' needs --device");
    }
    validate(cfg);
  } catch (const Error& e) {
    std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
    return EXIT_USAGE;
  }

  // Build the request before touching hardware, so usage errors never open a port
  int32_t format_id = opt_format_id;
  Bytes body;
  std::unique_ptr<Message> request;
  if (!opt_probe) {
    try {
      const MessageRegistry* table = request_table(cfg.profile);
      if (table) {
        if (opt_type.empty()) throw std::invalid_argument("--type is required for profile '" + cfg.profile + "'");
        const MessageDescriptor* d = find_request(*table, opt_type);
        if (!d) throw std::invalid_argument("unknown message type '" + opt_type + "'");
        request = std::make_unique<Message>(*d);
        if (cfg.profile == "safety") request->set("command", static_cast<uint64_t>(d->type_id));
        for (const auto& a : opt_set) apply_assignment(*request, a);
        body = request->encode();
        format_id = cfg.profile == "fixture" ? d->type_id : safety::MESSAGE_FORMAT;
      } else {
        if (opt_body_hex.empty()) throw std::invalid_argument("--body is required for profile '" + cfg.profile + "'");
        body = parse_hex(opt_body_hex);
      }
      require_frameable(cfg.framing, body.size());
    } catch (const Error& e) {
      std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
      return EXIT_USAGE;
    } catch (const std::logic_error& e) {
      std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
      return EXIT_USAGE;
    }
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  // Transports before the manager: the manager borrows them
  std::unique_ptr<transport::ITransport> data;
  std::unique_ptr<transport::ITransport> hs;
  std::unique_ptr<ConnectionManager> channel;
  try {
    data = make_transport(cfg);
    hs = make_handshake_transport(cfg);
    channel = std::make_unique<ConnectionManager>(cfg, *data, hs.get(), log);
  } catch (const Error& e) {
    std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
    return EXIT_USAGE;
  }

  const LinkStatus started = channel->start(&g_cancel);
  if (started != LinkStatus::Ok) {
    const std::string reason = channel->fault_reason().empty() ? to_string(started) : channel->fault_reason();
    print_failure(opt_format, ansi, to_string(started), reason);
    return exit_for(started);
  }

  if (opt_probe) {
    if (opt_format == "json") {
      json j;
      j["status"] = "ok";
      j["channel"] = cfg.name;
      j["state"] = to_string(channel->state());
      std::cout << j.dump(2) << "\n";
    } else {
      std::cout << ansi.bold(cfg.name) << "  " << to_string(channel->state()) << "\n";
    }
    return EXIT_OK;
  }

  const int timeout_ms = opt_timeout_ms > 0 ? opt_timeout_ms : cfg.recv_timeout_ms;
  Frame reply;
  LinkStatus st = LinkStatus::IoError;
  try {
    st = channel->exchange(format_id, body, reply, timeout_ms, &g_cancel);
  } catch (const Error& e) {
    std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
    return EXIT_USAGE;
  }
  if (st != LinkStatus::Ok) {
    const std::string reason = st == LinkStatus::Timeout
        ? "no reply within " + std::to_string(timeout_ms) + " ms"
        : (channel->fault_reason().empty() ? to_string(st) : channel->fault_reason());
    print_failure(opt_format, ansi, to_string(st), reason);
    return exit_for(st);
  }

  // Decode and print
  const MessageDescriptor* rd = find_reply(cfg.profile, reply);
  std::unique_ptr<Message> response;
  std::string decode_error;
  if (rd) {
    try {
      response = std::make_unique<Message>(*rd, reply.body);
    } catch (const DecodingError& e) {
      decode_error = e.what();
    }
  }

  if (opt_format == "json") {
    json j;
    j["status"] = "ok";
    j["channel"] = cfg.name;
    if (request) {
      j["request"]["type"] = request->descriptor().name.c_str();
      j["request"]["fields"] = fields_json(*request);
    } else {
      j["request"]["body"] = to_hex(body);
    }
    j["request"]["format_id"] = format_id;
    j["response"]["format_id"] = reply.format_id;
    if (response) {
      j["response"]["type"] = response->descriptor().name.c_str();
      j["response"]["fields"] = fields_json(*response);
    } else {
      j["response"]["body"] = to_hex(reply.body);
      if (!decode_error.empty()) j["response"]["error"] = decode_error;
    }
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << ansi.bold("OUT ") << (request ? request->to_string() : to_hex(body)) << "\n";
    if (response) {
      std::cout << ansi.bold("IN  ") << response->to_string() << "\n";
    } else {
      std::cout << ansi.bold("IN  ") << ansi.dim("format " + std::to_string(reply.format_id) + " ")
                << to_hex(reply.body) << "\n";
      if (!decode_error.empty()) std::cout << "  " << ansi.red(decode_error) << "\n";
    }
  }

  return EXIT_OK;
}
