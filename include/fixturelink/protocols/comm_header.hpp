/**
 * @file comm_header.hpp
 * @brief The 12-byte little-endian communication header shared by the safety
 *        interface (serial) and the vehicle controller (UDP).
 *
 *     Offset 0-1   sync           u16
 *     Offset 2-3   length         u16   body bytes only
 *     Offset 4-7   crc            u32   chained CRC-32 over [8..12) then body
 *     Offset 8-9   message_format u16
 *     Offset 10-11 reserved       u16
 *
 * The two devices disagree on the sync value: the safety board sends wire
 * bytes CA FE (0xFECA little-endian), the vehicle controller FE CA (0xCAFE).
 */
#ifndef FIXTURELINK_PROTOCOLS_COMM_HEADER_HPP
#define FIXTURELINK_PROTOCOLS_COMM_HEADER_HPP

#include <cstddef>
#include <cstdint>

#include "fixturelink/frame.hpp"

namespace fixturelink::comm {

constexpr size_t   HEADER_SIZE = 12;
constexpr size_t   CRC_OFFSET = 8;
constexpr uint32_t MAX_MESSAGE_BODY_LENGTH = 1000;

/// Layout of CommMsgHeader (BodyOnly length, checksum in the header, no footer).
const FrameLayout& frame_layout();

/// Layout + chained CRC-32 from CRC_OFFSET + MAX_MESSAGE_BODY_LENGTH, with @p sync.
FrameFormat frame_format(uint16_t sync);

} // namespace fixturelink::comm

#endif // FIXTURELINK_PROTOCOLS_COMM_HEADER_HPP
