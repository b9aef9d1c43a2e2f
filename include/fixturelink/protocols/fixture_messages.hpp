/**
 * @page fl-fixture fixturelink Chassis Fixture Messages
 * @file fixture_messages.hpp
 * @brief Static message table for the chassis rotation fixture (serial channel B).
 *
 * @details
 * WIRE FORMAT (big-endian throughout)
 * -----------------------------------
 *
 *     TransportHeader  sync_word u32 (0xA5FF00CC) | length u16 | msg_type i16
 *     body             fields of the message named by msg_type
 *     TransportFooter  crc16 u16   CRC-16/KERMIT over header + body
 *
 * `length` counts the whole frame: header + body + footer, so the smallest
 * legal value is TRANSPORT_OVERHEAD (10) for a message without fields.
 *
 * MESSAGE TABLE
 * -------------
 * | Code | Message                      | Fields                          |
 * |------|------------------------------|---------------------------------|
 * | -10  | TransportHeader              | sync_word, length, msg_type     |
 * | -9   | TransportFooter              | crc16                           |
 * | 0x10 | ActuateCliffSensorDoor       | door_number u8, close_open u8   |
 * | 0x11 | ActuateCliffSensorDoorStatus | status u8                       |
 * | 0x12 | ReadEncoderCount             | left_right u8                   |
 * | 0x13 | EncoderCount                 | status u8, count u32            |
 * | 0x14 | WaitForTurntable             | timeout_seconds u8              |
 * | 0x15 | WaitForTurntableStatus       | status u8                       |
 * | 0x16 | RotateTurntable              | operation u8, angle u16         |
 * | 0x17 | RotateTurntableStatus        | status u8                       |
 * | 0x1A | GetTurntableAngle            | (none)                          |
 * | 0x1B | TurntableAngleRsp            | angle u16                       |
 *
 * An even, non-negative code `t` is a request; its reply is `t + 1`.
 */
#ifndef FIXTURELINK_PROTOCOLS_FIXTURE_MESSAGES_HPP
#define FIXTURELINK_PROTOCOLS_FIXTURE_MESSAGES_HPP

#include <cstddef>
#include <cstdint>

#include "fixturelink/frame.hpp"
#include "fixturelink/message_registry.hpp"

namespace fixturelink::fixture {

constexpr uint32_t SYNC_WORD = 0xA5FF00CC;
constexpr int      DEFAULT_BAUD = 9600;
constexpr int      BOOT_DELAY_MS = 500;      // board resets when the port opens
constexpr int      RECV_TIMEOUT_MS = 1000;
constexpr uint32_t MAX_FRAME_LENGTH = 1000;

enum MsgType : int32_t {
  TRANSPORT_HEADER                  = -10,
  TRANSPORT_FOOTER                  = -9,
  ACTUATE_CLIFF_SENSOR_DOOR         = 0x10,
  ACTUATE_CLIFF_SENSOR_DOOR_STATUS  = 0x11,
  READ_ENCODER_COUNT                = 0x12,
  ENCODER_COUNT                     = 0x13,
  WAIT_FOR_TURNTABLE                = 0x14,
  WAIT_FOR_TURNTABLE_STATUS         = 0x15,
  ROTATE_TURNTABLE                  = 0x16,
  ROTATE_TURNTABLE_STATUS           = 0x17,
  GET_TURNTABLE_ANGLE               = 0x1A,
  TURNTABLE_ANGLE_RSP               = 0x1B,
};

// Field enumerations carried as u8 on the wire.
enum CloseOpen : uint8_t { CLOSE = 0, OPEN = 1 };
enum LeftRight : uint8_t { LEFT = 0, RIGHT = 1 };
enum Status    : uint8_t { SUCCESS = 0, GENERAL_FAILURE = 1, TIMEOUT_EXPIRED = 2 };
enum Operation : uint8_t { ROTATE_TO_OPTO_SWITCH = 0, ROTATE_LEFT = 1, ROTATE_RIGHT = 2 };

const char* status_name(uint8_t status);

/// Every fixture message, including the transport header and footer.
const MessageRegistry& registry();

/// Header + footer roles, WholeFrame length.
const FrameLayout& frame_layout();

FrameFormat frame_format();

/// Header + footer size (10).
size_t transport_overhead();

} // namespace fixturelink::fixture

#endif // FIXTURELINK_PROTOCOLS_FIXTURE_MESSAGES_HPP
