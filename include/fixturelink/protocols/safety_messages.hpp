/**
 * @page fl-safety fixturelink Safety Interface Messages
 * @file safety_messages.hpp
 * @brief Body layouts for the LS-series safety/sensor interface (serial channel A).
 *
 * @details
 * Frames use the CommMsgHeader (see comm_header.hpp) with sync wire bytes
 * CA FE and message_format 0. The body starts with three bytes:
 *
 *     command u8 | response u8 | sensor u8 | params...
 *
 * `response` is 0 in a request and 1 in the board's reply. Params exist only
 * in replies:
 *
 * | Command      | Code | Reply params       |
 * |--------------|------|--------------------|
 * | CLIFF        | 0    | millivolts u16     |
 * | ENCODER      | 1    | speed i32          |
 *
 * Requests and replies are keyed by the command code in two registries.
 */
#ifndef FIXTURELINK_PROTOCOLS_SAFETY_MESSAGES_HPP
#define FIXTURELINK_PROTOCOLS_SAFETY_MESSAGES_HPP

#include <cstdint>

#include "fixturelink/frame.hpp"
#include "fixturelink/message_registry.hpp"

namespace fixturelink::safety {

constexpr uint16_t SYNC = 0xFECA;          // wire CA FE
constexpr int      DEFAULT_BAUD = 9600;
constexpr uint16_t MESSAGE_FORMAT = 0;

enum Command : uint8_t {
  CLIFF   = 0,
  ENCODER = 1,
};

FrameFormat frame_format();

/// Request bodies keyed by command code.
const MessageRegistry& requests();

/// Reply bodies keyed by command code.
const MessageRegistry& responses();

/// Body of a request for @p command on @p sensor. Throws EncodingError for an unknown command.
Bytes make_request(uint8_t command, uint8_t sensor);

/// Reply descriptor matching @p body (command byte + exact size), or nullptr.
const MessageDescriptor* response_for_body(const Bytes& body);

} // namespace fixturelink::safety

#endif // FIXTURELINK_PROTOCOLS_SAFETY_MESSAGES_HPP
