#include <doctest/doctest.h>
#include <cstring>
#include "fixturelink/checksum.hpp"

using namespace fixturelink;

static const uint8_t CHECK_INPUT[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};

TEST_CASE("CRC check values") {
    CHECK(crc::crc32(CHECK_INPUT, sizeof CHECK_INPUT) == 0xCBF43926u);
    CHECK(crc::crc16_kermit(CHECK_INPUT, sizeof CHECK_INPUT) == 0x2189);
    CHECK(crc::crc32(CHECK_INPUT, 0) == 0u);
}

TEST_CASE("Chained CRC-32 seeds each range with the previous result") {
    const uint8_t tail[] = {0x00, 0x00, 0x00, 0x00};
    const uint8_t body[] = {0x01, 0x00, 0x10, 0x20};
    ByteRanges ranges{{tail, sizeof tail}, {body, sizeof body}};

    const uint32_t step = crc::crc32(body, sizeof body, crc::crc32(tail, sizeof tail));
    CHECK(compute(ChecksumAlgorithm::Crc32Chained, ranges) == step);
    CHECK(verify(ChecksumAlgorithm::Crc32Chained, ranges, step));
    CHECK_FALSE(verify(ChecksumAlgorithm::Crc32Chained, ranges, step ^ 1u));
}

TEST_CASE("A single flipped bit always changes the checksum") {
    uint8_t buf[16];
    for (size_t i = 0; i < sizeof buf; ++i) buf[i] = static_cast<uint8_t>(i * 37 + 11);
    const uint32_t ref32 = crc::crc32(buf, sizeof buf);
    const uint16_t ref16 = crc::crc16_kermit(buf, sizeof buf);

    for (size_t byte = 0; byte < sizeof buf; ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            uint8_t flipped[sizeof buf];
            std::memcpy(flipped, buf, sizeof buf);
            flipped[byte] ^= static_cast<uint8_t>(1u << bit);
            CHECK(crc::crc32(flipped, sizeof flipped) != ref32);
            CHECK(crc::crc16_kermit(flipped, sizeof flipped) != ref16);
        }
    }
}

TEST_CASE("A 16-bit check never matches a value wider than 16 bits") {
    ByteRanges ranges{{CHECK_INPUT, sizeof CHECK_INPUT}};
    CHECK(verify(ChecksumAlgorithm::Crc16Kermit, ranges, 0x2189));
    CHECK_FALSE(verify(ChecksumAlgorithm::Crc16Kermit, ranges, 0x10002189));
}

TEST_CASE("Coverage starts at the configured header offset") {
    const uint8_t header[12] = {0xCA, 0xFE, 4, 0, 9, 9, 9, 9, 0x03, 0x00, 0x00, 0x00};
    const uint8_t body[2] = {0xAA, 0xBB};
    ChecksumPolicy policy{ChecksumAlgorithm::Crc32Chained, 8};

    ByteRanges r = checksum_ranges(policy, header, sizeof header, body, sizeof body);
    REQUIRE(r.size() == 2);
    CHECK(r[0].data == header + 8);
    CHECK(r[0].size == 4);
    CHECK(r[1].data == body);
    CHECK(r[1].size == 2);

    policy.coverage_offset = 40;   // clamped to the header end
    r = checksum_ranges(policy, header, sizeof header, body, sizeof body);
    CHECK(r[0].size == 0);
}

TEST_CASE("Algorithm names parse back") {
    ChecksumAlgorithm a = ChecksumAlgorithm::Crc32Chained;
    CHECK(parse_algorithm("crc16-kermit", a));
    CHECK(a == ChecksumAlgorithm::Crc16Kermit);
    CHECK(parse_algorithm(algorithm_name(ChecksumAlgorithm::Crc32Chained), a));
    CHECK(a == ChecksumAlgorithm::Crc32Chained);
    CHECK_FALSE(parse_algorithm("md5", a));
    CHECK(checksum_width(ChecksumAlgorithm::Crc16Kermit) == 2);
}
