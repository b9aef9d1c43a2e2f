// ============================================================================
// channel_config.cpp — implementation for channel_config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/channel_config.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/protocols/fixture_messages.hpp"
#include "fixturelink/protocols/safety_messages.hpp"
#include "fixturelink/protocols/vcu_messages.hpp"
#include "fixturelink/stream_buffer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <initializer_list>

using nlohmann::json;

namespace fixturelink {

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------
ChannelConfig safety_channel(const std::string& device) {
  ChannelConfig c;
  c.name = "safety";
  c.profile = "safety";
  c.framing = safety::frame_format();
  c.link = LinkKind::Serial;
  c.serial.path = device;
  c.serial.baud = safety::DEFAULT_BAUD;
  c.recv_timeout_ms = 3000;
  return c;
}

ChannelConfig fixture_channel(const std::string& device) {
  ChannelConfig c;
  c.name = "fixture";
  c.profile = "fixture";
  c.framing = fixture::frame_format();
  c.link = LinkKind::Serial;
  c.serial.path = device;
  c.serial.baud = fixture::DEFAULT_BAUD;
  c.serial.boot_delay_ms = fixture::BOOT_DELAY_MS;
  c.recv_timeout_ms = fixture::RECV_TIMEOUT_MS;
  return c;
}

ChannelConfig vcu_channel(const std::string& host) {
  ChannelConfig c;
  c.name = "vcu";
  c.profile = "vcu";
  c.framing = vcu::frame_format();
  c.link = LinkKind::Udp;
  c.udp.host = host;
  c.udp.port = vcu::TEST_PORT;
  c.handshake_port = vcu::CONNECT_PORT;
  c.handshake.mode = HandshakeMode::Echo;
  c.handshake.retries = vcu::CONNECT_RETRIES;
  c.handshake.timeout_ms = vcu::CONNECT_TIMEOUT_MS;
  c.handshake.delay_ms = vcu::CONNECT_DELAY_MS;
  c.handshake.literal = vcu::CONNECT_LITERAL;
  c.recv_timeout_ms = vcu::RECV_TIMEOUT_MS;
  return c;
}

ChannelConfig preset(const std::string& profile) {
  if (profile == "safety")  return safety_channel("");
  if (profile == "fixture") return fixture_channel("");
  if (profile == "vcu")     return vcu_channel(vcu::DEFAULT_HOST);
  throw ConfigError("unknown profile '" + profile + "' (expected safety, fixture or vcu)");
}

// ---------------------------------------------------------------------------
// JSON helpers
// ------------
// Every nlohmann exception is rethrown as ConfigError with the key path in
// front, so a bad file reports "channel 'vcu'.handshake.retries: ..." instead
// of a bare type_error.
// ---------------------------------------------------------------------------
static void reject_unknown_keys(const json& j, const std::string& where,
                                std::initializer_list<const char*> allowed) {
  if (!j.is_object()) throw ConfigError(where + ": expected an object");
  for (auto it = j.begin(); it != j.end(); ++it) {
    const bool known = std::any_of(allowed.begin(), allowed.end(),
                                   [&](const char* k) { return it.key() == k; });
    if (!known) throw ConfigError(where + ": unknown key '" + it.key() + "'");
  }
}

template <typename T>
static T get_as(const json& j, const char* key, const std::string& where) {
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(where + "." + key + ": " + e.what());
  }
}

static int64_t get_int(const json& j, const char* key, const std::string& where, int64_t lo, int64_t hi) {
  const json& v = j.at(key);
  if (!v.is_number_integer()) throw ConfigError(where + "." + key + ": expected an integer");
  const int64_t x = v.get<int64_t>();
  if (x < lo || x > hi) {
    throw ConfigError(where + "." + key + ": " + std::to_string(x) + " outside [" +
                      std::to_string(lo) + ", " + std::to_string(hi) + "]");
  }
  return x;
}

static uint32_t get_sync(const json& j, const std::string& where) {
  const json& v = j.at("sync");
  if (v.is_number_unsigned() || v.is_number_integer()) {
    const int64_t x = v.get<int64_t>();
    if (x < 0 || x > 0xFFFFFFFFLL) throw ConfigError(where + ".sync: out of range");
    return static_cast<uint32_t>(x);
  }
  if (v.is_string()) {
    const std::string s = v.get<std::string>();
    size_t used = 0;
    unsigned long x = 0;
    try {
      x = std::stoul(s, &used, 0);
    } catch (const std::exception&) {
      throw ConfigError(where + ".sync: '" + s + "' is not a number");
    }
    if (used != s.size() || x > 0xFFFFFFFFUL) throw ConfigError(where + ".sync: '" + s + "' is not a 32-bit value");
    return static_cast<uint32_t>(x);
  }
  throw ConfigError(where + ".sync: expected an integer or a \"0x...\" string");
}

static void apply_handshake(const json& h, HandshakePolicy& p, const std::string& where) {
  reject_unknown_keys(h, where, {"mode", "retries", "timeout_ms", "delay_ms", "literal",
                                 "probe_format_id", "probe_body"});
  if (h.contains("mode")) {
    const std::string m = get_as<std::string>(h, "mode", where);
    if (!parse_handshake_mode(m, p.mode)) throw ConfigError(where + ".mode: unknown mode '" + m + "'");
  }
  if (h.contains("retries"))    p.retries    = static_cast<int>(get_int(h, "retries", where, 1, 1000));
  if (h.contains("timeout_ms")) p.timeout_ms = static_cast<int>(get_int(h, "timeout_ms", where, 1, 600000));
  if (h.contains("delay_ms"))   p.delay_ms   = static_cast<int>(get_int(h, "delay_ms", where, 0, 600000));
  if (h.contains("literal"))    p.literal    = get_as<std::string>(h, "literal", where);
  if (h.contains("probe_format_id"))
    p.probe_format_id = static_cast<int32_t>(get_int(h, "probe_format_id", where, INT32_MIN, INT32_MAX));
  if (h.contains("probe_body")) p.probe_body = parse_hex(get_as<std::string>(h, "probe_body", where));
}

static void apply_checksum(const json& c, FrameFormat& f, const std::string& where) {
  reject_unknown_keys(c, where, {"algorithm", "coverage_offset"});
  if (c.contains("algorithm")) {
    const std::string a = get_as<std::string>(c, "algorithm", where);
    if (!parse_algorithm(a, f.checksum.algorithm)) throw ConfigError(where + ".algorithm: unknown '" + a + "'");
  }
  if (c.contains("coverage_offset"))
    f.checksum.coverage_offset = static_cast<size_t>(get_int(c, "coverage_offset", where, 0, 255));
}

ChannelConfig channel_config_from_json(const json& j) {
  std::string where = "channel";
  reject_unknown_keys(j, where, {"name", "profile", "device", "baud", "boot_delay_ms", "host", "port",
                                 "local_port", "handshake_port", "sync", "max_frame_length", "checksum",
                                 "recv_timeout_ms", "desync_fault_threshold", "handshake"});

  const std::string name = get_as<std::string>(j, "name", where);
  where = "channel '" + name + "'";
  ChannelConfig c = preset(get_as<std::string>(j, "profile", where));
  c.name = name;

  if (j.contains("device"))         c.serial.path = get_as<std::string>(j, "device", where);
  if (j.contains("baud"))           c.serial.baud = static_cast<int>(get_int(j, "baud", where, 1, 4000000));
  if (j.contains("boot_delay_ms"))  c.serial.boot_delay_ms = static_cast<int>(get_int(j, "boot_delay_ms", where, 0, 60000));
  if (j.contains("host"))           c.udp.host = get_as<std::string>(j, "host", where);
  if (j.contains("port"))           c.udp.port = static_cast<uint16_t>(get_int(j, "port", where, 1, 65535));
  if (j.contains("local_port"))     c.udp.local_port = static_cast<uint16_t>(get_int(j, "local_port", where, 0, 65535));
  if (j.contains("handshake_port")) c.handshake_port = static_cast<uint16_t>(get_int(j, "handshake_port", where, 0, 65535));
  if (j.contains("sync"))           c.framing.sync_value = get_sync(j, where);
  if (j.contains("max_frame_length"))
    c.framing.max_frame_length = static_cast<uint32_t>(get_int(j, "max_frame_length", where, 1, 0xFFFFFFFFLL));
  if (j.contains("checksum"))       apply_checksum(j.at("checksum"), c.framing, where + ".checksum");
  if (j.contains("recv_timeout_ms"))
    c.recv_timeout_ms = static_cast<int>(get_int(j, "recv_timeout_ms", where, 1, 600000));
  if (j.contains("desync_fault_threshold"))
    c.desync_fault_threshold = static_cast<int>(get_int(j, "desync_fault_threshold", where, 1, 1000000));
  if (j.contains("handshake"))      apply_handshake(j.at("handshake"), c.handshake, where + ".handshake");

  if (c.link == LinkKind::Serial && c.serial.path.empty()) throw ConfigError(where + ": serial channel needs a device");
  validate(c);
  return c;
}

std::vector<ChannelConfig> channel_configs_from_json(const json& doc) {
  reject_unknown_keys(doc, "config", {"channels"});
  if (!doc.contains("channels") || !doc.at("channels").is_array())
    throw ConfigError("config: 'channels' must be an array");

  std::vector<ChannelConfig> out;
  for (const auto& ch : doc.at("channels")) {
    ChannelConfig c = channel_config_from_json(ch);
    const bool dup = std::any_of(out.begin(), out.end(), [&](const ChannelConfig& o) { return o.name == c.name; });
    if (dup) throw ConfigError("config: channel name '" + c.name + "' used twice");
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<ChannelConfig> load_channel_configs(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open " + path);
  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return channel_configs_from_json(doc);
}

// ---------------------------------------------------------------------------
// validate()
// ----------
// Cross-field checks that a single key cannot express. Called by the JSON
// loader and by ConnectionManager's constructor.
// ---------------------------------------------------------------------------
static bool supported_baud(int baud) {
  switch (baud) {
    case 9600: case 19200: case 38400: case 57600: case 115200: case 230400: case 460800:
      return true;
    default:
      return false;
  }
}

void validate(const ChannelConfig& c) {
  const std::string where = "channel '" + c.name + "'";
  const FrameLayout& L = c.framing.layout;

  if (c.name.empty()) throw ConfigError("channel without a name");

  const size_t sync_w = L.sync_width();
  if (sync_w == 0) throw ConfigError(where + ": layout has no sync field");
  if (sync_w < 4 && c.framing.sync_value >= (uint32_t{1} << (8 * sync_w)))
    throw ConfigError(where + ": sync value does not fit a " + std::to_string(sync_w) + "-byte field");

  const size_t min_len = L.length_mode == LengthMode::WholeFrame ? L.overhead() : 1;
  if (c.framing.max_frame_length < min_len)
    throw ConfigError(where + ": max_frame_length below the smallest legal frame");
  if (L.length_field >= 0) {
    const size_t len_w = field_width(L.header.fields[L.length_field].kind);
    if (len_w < 4 && c.framing.max_frame_length >= (uint32_t{1} << (8 * len_w)))
      throw ConfigError(where + ": max_frame_length does not fit the length field");
  }
  if (c.framing.checksum.coverage_offset > L.header_size())
    throw ConfigError(where + ": checksum coverage_offset past the end of the header");

  if (c.link == LinkKind::Serial) {
    if (!supported_baud(c.serial.baud)) throw ConfigError(where + ": unsupported baud " + std::to_string(c.serial.baud));
  } else {
    if (c.udp.host.empty()) throw ConfigError(where + ": host is empty");
    if (c.udp.port == 0)    throw ConfigError(where + ": port is 0");
    // One datagram must fit one stream buffer read
    if (max_wire_length(c.framing) > StreamBuffer::CHUNK)
      throw ConfigError(where + ": max_frame_length allows " + std::to_string(max_wire_length(c.framing)) +
                        "-byte frames, over the " + std::to_string(StreamBuffer::CHUNK) + "-byte udp read");
  }

  const HandshakePolicy& h = c.handshake;
  if (h.retries < 1)    throw ConfigError(where + ": handshake retries must be >= 1");
  if (h.timeout_ms < 1) throw ConfigError(where + ": handshake timeout_ms must be >= 1");
  if (h.delay_ms < 0)   throw ConfigError(where + ": handshake delay_ms must be >= 0");
  if (h.mode == HandshakeMode::Echo) {
    if (c.link != LinkKind::Udp) throw ConfigError(where + ": echo handshake needs a udp link");
    if (c.handshake_port == 0)   throw ConfigError(where + ": echo handshake needs handshake_port");
    if (h.literal.empty())       throw ConfigError(where + ": echo handshake literal is empty");
  }
  if (h.mode == HandshakeMode::FrameProbe && L.length_mode == LengthMode::BodyOnly && h.probe_body.empty())
    throw ConfigError(where + ": probe handshake needs a probe_body on this layout");

  if (c.recv_timeout_ms < 1)         throw ConfigError(where + ": recv_timeout_ms must be >= 1");
  if (c.desync_fault_threshold < 1)  throw ConfigError(where + ": desync_fault_threshold must be >= 1");
}

// ---------------------------------------------------------------------------
// Transports
// ---------------------------------------------------------------------------
std::unique_ptr<transport::ITransport> make_transport(const ChannelConfig& c) {
  if (c.link == LinkKind::Udp) return std::make_unique<transport::UdpSocket>(c.udp);
  return std::make_unique<transport::LinuxSerial>(c.serial);
}

std::unique_ptr<transport::ITransport> make_handshake_transport(const ChannelConfig& c) {
  if (c.handshake.mode != HandshakeMode::Echo) return nullptr;
  transport::UdpConfig u;
  u.host = c.udp.host;
  u.port = c.handshake_port;
  return std::make_unique<transport::UdpSocket>(u);
}

// ---------------------------------------------------------------------------
// Names and hex
// ---------------------------------------------------------------------------
const char* to_string(LinkKind k) {
  return k == LinkKind::Udp ? "udp" : "serial";
}

const char* to_string(HandshakeMode m) {
  switch (m) {
    case HandshakeMode::None:       return "none";
    case HandshakeMode::Echo:       return "echo";
    case HandshakeMode::FrameProbe: return "probe";
  }
  return "unknown";
}

bool parse_handshake_mode(const std::string& name, HandshakeMode& out) {
  if (name == "none")  { out = HandshakeMode::None;       return true; }
  if (name == "echo")  { out = HandshakeMode::Echo;       return true; }
  if (name == "probe") { out = HandshakeMode::FrameProbe; return true; }
  return false;
}

static int hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  const int lower = std::tolower(static_cast<unsigned char>(ch));
  if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
  return -1;
}

Bytes parse_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) throw ConfigError("hex string '" + hex + "' has odd length");
  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = hex_digit(hex[i]);
    const int lo = hex_digit(hex[i + 1]);
    if (hi < 0 || lo < 0) throw ConfigError("hex string '" + hex + "' has a non-hex digit");
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string to_hex(const Bytes& bytes) {
  static const char* digits = "0123456789ABCDEF";
  std::string s;
  s.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    s.push_back(digits[b >> 4]);
    s.push_back(digits[b & 0x0F]);
  }
  return s;
}

} // namespace fixturelink
