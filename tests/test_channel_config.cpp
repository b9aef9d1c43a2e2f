#include <doctest/doctest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "fixturelink/channel_config.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/frame.hpp"
#include "fixturelink/protocols/fixture_messages.hpp"
#include "fixturelink/protocols/vcu_messages.hpp"
#include "nlohmann/json.hpp"

using json = nlohmann::json;
using namespace fixturelink;
namespace fs = std::filesystem;

static const char* BENCH = R"({
  "channels": [
    { "name": "door", "profile": "fixture", "device": "/dev/ttyACM0" },
    { "name": "cliff", "profile": "safety", "device": "/dev/ttyUSB1", "baud": 115200,
      "recv_timeout_ms": 500, "desync_fault_threshold": 5 },
    { "name": "vcu", "profile": "vcu", "host": "10.0.0.7",
      "handshake": { "retries": 3, "timeout_ms": 100, "delay_ms": 0 } }
  ]
})";

TEST_CASE("Presets carry each channel's wire constants") {
    const ChannelConfig f = fixture_channel("/dev/ttyACM0");
    CHECK(f.framing.sync_value == fixture::SYNC_WORD);
    CHECK(f.framing.checksum.algorithm == ChecksumAlgorithm::Crc16Kermit);
    CHECK(f.serial.boot_delay_ms == fixture::BOOT_DELAY_MS);
    CHECK(f.handshake.mode == HandshakeMode::None);

    const ChannelConfig s = safety_channel("/dev/ttyUSB0");
    CHECK(s.framing.checksum.coverage_offset == 8);
    CHECK(s.recv_timeout_ms == 3000);

    const ChannelConfig v = vcu_channel("192.168.3.100");
    CHECK(v.link == LinkKind::Udp);
    CHECK(v.udp.port == vcu::TEST_PORT);
    CHECK(v.handshake_port == vcu::CONNECT_PORT);
    CHECK(v.handshake.mode == HandshakeMode::Echo);
    CHECK(v.handshake.retries == 15);

    CHECK_THROWS_AS(preset("lidar"), ConfigError);
}

TEST_CASE("Bench file loads every channel with overrides applied") {
    const auto channels = channel_configs_from_json(json::parse(BENCH));
    REQUIRE(channels.size() == 3);

    CHECK(channels[0].name == "door");
    CHECK(channels[0].serial.path == "/dev/ttyACM0");

    CHECK(channels[1].serial.baud == 115200);
    CHECK(channels[1].recv_timeout_ms == 500);
    CHECK(channels[1].desync_fault_threshold == 5);

    CHECK(channels[2].udp.host == "10.0.0.7");
    CHECK(channels[2].handshake.retries == 3);
    CHECK(channels[2].handshake.delay_ms == 0);
    CHECK(channels[2].handshake.literal == "connect");
}

TEST_CASE("Sync, checksum and probe settings parse") {
    const json j = json::parse(R"({
        "name": "custom", "profile": "fixture", "device": "/dev/null",
        "sync": "0xA5FF00CD", "max_frame_length": 200,
        "checksum": { "algorithm": "crc16-kermit", "coverage_offset": 0 },
        "handshake": { "mode": "probe", "probe_format_id": 26, "probe_body": "0aFF" }
    })");
    const ChannelConfig c = channel_config_from_json(j);
    CHECK(c.framing.sync_value == 0xA5FF00CDu);
    CHECK(c.framing.max_frame_length == 200);
    CHECK(c.handshake.mode == HandshakeMode::FrameProbe);
    CHECK(c.handshake.probe_format_id == 26);
    const Bytes probe{0x0A, 0xFF};
    CHECK(c.handshake.probe_body == probe);
}

TEST_CASE("Malformed channel entries are rejected with ConfigError") {
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"fixture","device":"/dev/a","bogus":1})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"fixture"})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"vcu","handshake":{"retries":"three"}})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"vcu","handshake":{"retries":0}})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"safety","device":"/dev/a","sync":"0x1FFFF"})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"safety","device":"/dev/a","baud":1234})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"safety","device":"/dev/a","handshake":{"mode":"echo"}})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"x","profile":"fixture","device":"/dev/a","max_frame_length":5})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"profile":"fixture","device":"/dev/a"})")), ConfigError);
}

TEST_CASE("Channel names are unique within one file") {
    const json doc = json::parse(R"({"channels":[
        {"name":"a","profile":"vcu"}, {"name":"a","profile":"vcu"}]})");
    CHECK_THROWS_AS(channel_configs_from_json(doc), ConfigError);
    CHECK_THROWS_AS(channel_configs_from_json(json::parse(R"({"channels":{}})")), ConfigError);
}

TEST_CASE("Loading from disk") {
    const fs::path path = fs::temp_directory_path() / "fixturelink-test-bench.json";
    {
        std::ofstream out(path);
        out << BENCH;
    }
    const auto channels = load_channel_configs(path.string());
    CHECK(channels.size() == 3);
    fs::remove(path);

    CHECK_THROWS_AS(load_channel_configs((fs::temp_directory_path() / "fixturelink-missing.json").string()),
                    ConfigError);

    const fs::path broken = fs::temp_directory_path() / "fixturelink-test-broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"channels\": [";
    }
    CHECK_THROWS_AS(load_channel_configs(broken.string()), ConfigError);
    fs::remove(broken);
}

TEST_CASE("Hex helpers") {
    const Bytes b{0x00, 0xAB, 0x7F};
    CHECK(to_hex(b) == "00AB7F");
    CHECK(parse_hex("00ab7F") == b);
    CHECK(parse_hex("").empty());
    CHECK_THROWS_AS(parse_hex("abc"), ConfigError);
    CHECK_THROWS_AS(parse_hex("zz"), ConfigError);
}

TEST_CASE("Echo handshake gets its own transport; other modes do not") {
    CHECK(make_handshake_transport(vcu_channel("127.0.0.1")) != nullptr);
    CHECK(make_handshake_transport(fixture_channel("/dev/null")) == nullptr);
}

TEST_CASE("A udp channel's largest frame must fit one read") {
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"v","profile":"vcu","max_frame_length":5000})")), ConfigError);
    CHECK_THROWS_AS(channel_config_from_json(json::parse(
        R"({"name":"v","profile":"vcu","max_frame_length":4085})")), ConfigError);

    const ChannelConfig edge = channel_config_from_json(json::parse(
        R"({"name":"v","profile":"vcu","max_frame_length":4084})"));
    CHECK(max_wire_length(edge.framing) == 4096);

    // Serial links have no datagram boundary to respect.
    const ChannelConfig serial = channel_config_from_json(json::parse(
        R"({"name":"s","profile":"safety","device":"/dev/a","max_frame_length":5000})"));
    CHECK(serial.framing.max_frame_length == 5000);
}
