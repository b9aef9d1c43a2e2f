/**
 * @page fl-config fixturelink Channel Configuration
 * @file channel_config.hpp
 * @brief Static per-channel settings: framing, link parameters, handshake policy.
 *
 * @details
 * A ChannelConfig is built once at startup, either from a preset
 * (safety_channel(), fixture_channel(), vcu_channel()) or from a JSON file:
 *
 * @code{.json}
 * {
 *   "channels": [
 *     { "name": "turntable", "profile": "fixture", "device": "/dev/ttyUSB0" },
 *     { "name": "vcu", "profile": "vcu", "host": "192.168.3.100",
 *       "handshake": { "retries": 15, "timeout_ms": 100, "delay_ms": 100 } },
 *     { "name": "cliff", "profile": "safety", "device": "/dev/ttyUSB1",
 *       "max_frame_length": 64 }
 *   ]
 * }
 * @endcode
 *
 * The profile picks the frame layout and defaults; every other key overrides
 * one default. Recognised keys:
 *
 * | Key                    | Type            | Applies to      |
 * |------------------------|-----------------|-----------------|
 * | name                   | string          | all (required)  |
 * | profile                | string          | all (required)  |
 * | device, baud, boot_delay_ms | string/int | serial          |
 * | host, port, local_port, handshake_port | string/int | udp |
 * | sync                   | int or "0x.."   | all             |
 * | max_frame_length       | int             | all             |
 * | checksum.algorithm     | "crc32-chained" / "crc16-kermit" | all |
 * | checksum.coverage_offset | int           | all             |
 * | recv_timeout_ms        | int             | all             |
 * | desync_fault_threshold | int             | all             |
 * | handshake.mode         | "none" / "echo" / "probe" | all   |
 * | handshake.retries, timeout_ms, delay_ms | int | all        |
 * | handshake.literal      | string          | echo            |
 * | handshake.probe_format_id, probe_body (hex) | int/string | probe |
 *
 * Unknown keys, wrong types and inconsistent values throw ConfigError; a
 * typo in a bench file should stop the station, not silently fall back.
 */
#ifndef FIXTURELINK_CHANNEL_CONFIG_HPP
#define FIXTURELINK_CHANNEL_CONFIG_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fixturelink/frame.hpp"
#include "fixturelink/transport/transport_base.hpp"
#include "fixturelink/transport/transport_linux_serial.hpp"
#include "fixturelink/transport/transport_udp.hpp"

namespace fixturelink {

enum class LinkKind : uint8_t { Serial, Udp };
enum class HandshakeMode : uint8_t { None, Echo, FrameProbe };

struct HandshakePolicy {
  HandshakeMode mode{HandshakeMode::None};
  int retries{1};
  int timeout_ms{100};          ///< per attempt
  int delay_ms{0};              ///< between attempts, never after the last one
  std::string literal{"connect"};
  int32_t probe_format_id{0};
  Bytes probe_body;
};

struct ChannelConfig {
  std::string name;
  std::string profile;
  FrameFormat framing;
  LinkKind link{LinkKind::Serial};
  transport::SerialConfig serial;
  transport::UdpConfig udp;
  uint16_t handshake_port{0};
  HandshakePolicy handshake;
  int recv_timeout_ms{1000};
  int desync_fault_threshold{3};
};

// --- presets ---------------------------------------------------------------
ChannelConfig safety_channel(const std::string& device);
ChannelConfig fixture_channel(const std::string& device);
ChannelConfig vcu_channel(const std::string& host);

/// Preset by profile name; throws ConfigError for an unknown profile.
ChannelConfig preset(const std::string& profile);

// --- loading ---------------------------------------------------------------
ChannelConfig channel_config_from_json(const nlohmann::json& j);
std::vector<ChannelConfig> channel_configs_from_json(const nlohmann::json& doc);
std::vector<ChannelConfig> load_channel_configs(const std::string& path);

/// Throws ConfigError when @p cfg is inconsistent.
void validate(const ChannelConfig& cfg);

// --- transports ------------------------------------------------------------
/// Data-link transport described by @p cfg (not yet opened).
std::unique_ptr<transport::ITransport> make_transport(const ChannelConfig& cfg);

/// Handshake transport for Echo mode (UDP to handshake_port), or nullptr.
std::unique_ptr<transport::ITransport> make_handshake_transport(const ChannelConfig& cfg);

const char* to_string(LinkKind k);
const char* to_string(HandshakeMode m);
bool parse_handshake_mode(const std::string& name, HandshakeMode& out);

/// "0A1b" -> {0x0A, 0x1B}; throws ConfigError on odd length or a non-hex digit.
Bytes parse_hex(const std::string& hex);
std::string to_hex(const Bytes& bytes);

} // namespace fixturelink

#endif // FIXTURELINK_CHANNEL_CONFIG_HPP
