/**
 * @page fl-checksum fixturelink Checksum Engine
 * @file checksum.hpp
 * @brief Pluggable frame integrity algorithms with configurable byte coverage.
 *
 * @details
 * ALGORITHMS
 * ----------
 * - **Crc32Chained**: CRC-32 (reflected poly 0xEDB88320, zlib seeding
 *   convention). The header tail is checksummed first and that value seeds the
 *   CRC of the body:
 *
 *       crc = crc32(body, seed = crc32(header[coverage_offset:]))
 *
 *   Controllers on the safety and vehicle links compute it in exactly these two
 *   steps, so the engine keeps the two-step form instead of folding it into a
 *   single pass.
 *
 * - **Crc16Kermit**: CRC-16/KERMIT (reflected poly 0x8408, init 0, no final
 *   xor) over the whole header followed by the body. Check value for
 *   "123456789" is 0x2189.
 *
 * COVERAGE
 * --------
 * A `ChecksumPolicy` pairs the algorithm with `coverage_offset`: the first
 * header byte that is covered. The body is always covered in full.
 *
 * | Channel           | Algorithm    | coverage_offset |
 * |-------------------|--------------|-----------------|
 * | safety (serial A) | Crc32Chained | 8               |
 * | vehicle (UDP)     | Crc32Chained | 8               |
 * | fixture (serial B)| Crc16Kermit  | 0               |
 */
#ifndef FIXTURELINK_CHECKSUM_HPP
#define FIXTURELINK_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fixturelink {

enum class ChecksumAlgorithm : uint8_t { Crc32Chained, Crc16Kermit };

/// A contiguous run of bytes covered by a checksum. Non-owning.
struct ByteRange {
  const uint8_t* data{nullptr};
  size_t size{0};
};

using ByteRanges = std::vector<ByteRange>;

struct ChecksumPolicy {
  ChecksumAlgorithm algorithm{ChecksumAlgorithm::Crc32Chained};
  size_t coverage_offset{0};
};

namespace crc {

/// Continue a CRC-32 from @p seed (0 starts a fresh one), zlib's crc32(seed, p, n).
uint32_t crc32(const uint8_t* data, size_t len, uint32_t seed = 0);

/// CRC-16/KERMIT continuing from @p seed (0 starts a fresh one).
uint16_t crc16_kermit(const uint8_t* data, size_t len, uint16_t seed = 0);

} // namespace crc

/// Checksum over @p ranges in order. For Crc32Chained each range is seeded with the CRC of the previous ones.
uint32_t compute(ChecksumAlgorithm algorithm, const ByteRanges& ranges);

/// compute() == expected, with the value truncated to the algorithm's width.
bool verify(ChecksumAlgorithm algorithm, const ByteRanges& ranges, uint32_t expected);

/// Ranges covered under @p policy for one frame.
ByteRanges checksum_ranges(const ChecksumPolicy& policy,
                           const uint8_t* header, size_t header_len,
                           const uint8_t* body, size_t body_len);

/// Width of the checksum value in bytes (4 or 2).
size_t checksum_width(ChecksumAlgorithm algorithm);

const char* algorithm_name(ChecksumAlgorithm algorithm);
bool parse_algorithm(const std::string& name, ChecksumAlgorithm& out);

} // namespace fixturelink

#endif // FIXTURELINK_CHECKSUM_HPP
