// ============================================================================
// checksum.cpp — implementation for checksum.hpp
// ============================================================================

#include "fixturelink/checksum.hpp"

#include <array>

namespace fixturelink {
namespace crc {

// ---------------------------------------------------------------------------
// Lookup tables, built once. Both algorithms are reflected, so the table is
// the classic LSB-first shift/xor over each byte value.
// ---------------------------------------------------------------------------
static std::array<uint32_t, 256> make_crc32_table() {
  std::array<uint32_t, 256> t{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k) c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    t[i] = c;
  }
  return t;
}

static std::array<uint16_t, 256> make_kermit_table() {
  std::array<uint16_t, 256> t{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint16_t c = static_cast<uint16_t>(i);
    for (int k = 0; k < 8; ++k) c = (c & 1) ? static_cast<uint16_t>((c >> 1) ^ 0x8408) : static_cast<uint16_t>(c >> 1);
    t[i] = c;
  }
  return t;
}

uint32_t crc32(const uint8_t* data, size_t len, uint32_t seed) {
  static const std::array<uint32_t, 256> table = make_crc32_table();
  uint32_t c = seed ^ 0xFFFFFFFFu;           // zlib: undo the previous final xor
  for (size_t i = 0; i < len; ++i) c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c ^ 0xFFFFFFFFu;
}

uint16_t crc16_kermit(const uint8_t* data, size_t len, uint16_t seed) {
  static const std::array<uint16_t, 256> table = make_kermit_table();
  uint16_t c = seed;
  for (size_t i = 0; i < len; ++i) c = static_cast<uint16_t>((c >> 8) ^ table[(c ^ data[i]) & 0xFF]);
  return c;
}

} // namespace crc

uint32_t compute(ChecksumAlgorithm algorithm, const ByteRanges& ranges) {
  switch (algorithm) {
    case ChecksumAlgorithm::Crc32Chained: {
      // Step by step: crc(range[n], seed = crc(range[n-1], ...)).
      uint32_t seed = 0;
      for (const auto& r : ranges) seed = crc::crc32(r.data, r.size, seed);
      return seed;
    }
    case ChecksumAlgorithm::Crc16Kermit: {
      uint16_t c = 0;
      for (const auto& r : ranges) c = crc::crc16_kermit(r.data, r.size, c);
      return c;
    }
  }
  return 0;
}

bool verify(ChecksumAlgorithm algorithm, const ByteRanges& ranges, uint32_t expected) {
  const uint32_t mask = checksum_width(algorithm) == 2 ? 0xFFFFu : 0xFFFFFFFFu;
  if ((expected & ~mask) != 0) return false;      // a 16-bit check never matches a wider value
  return compute(algorithm, ranges) == expected;
}

ByteRanges checksum_ranges(const ChecksumPolicy& policy,
                           const uint8_t* header, size_t header_len,
                           const uint8_t* body, size_t body_len) {
  ByteRanges ranges;
  const size_t off = policy.coverage_offset < header_len ? policy.coverage_offset : header_len;
  ranges.push_back({header + off, header_len - off});
  ranges.push_back({body, body_len});
  return ranges;
}

size_t checksum_width(ChecksumAlgorithm algorithm) {
  return algorithm == ChecksumAlgorithm::Crc16Kermit ? 2 : 4;
}

const char* algorithm_name(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::Crc32Chained: return "crc32-chained";
    case ChecksumAlgorithm::Crc16Kermit:  return "crc16-kermit";
  }
  return "unknown";
}

bool parse_algorithm(const std::string& name, ChecksumAlgorithm& out) {
  if (name == "crc32-chained" || name == "crc32") { out = ChecksumAlgorithm::Crc32Chained; return true; }
  if (name == "crc16-kermit"  || name == "kermit") { out = ChecksumAlgorithm::Crc16Kermit; return true; }
  return false;
}

} // namespace fixturelink
