/**
 * @file vcu_messages.hpp
 * @brief Constants for the vehicle control unit's UDP test link.
 *
 * Frames use the CommMsgHeader with sync 0xCAFE (wire FE CA). The body is
 * opaque to this layer: message_format says how the application should read
 * it (nanopb or a packed C struct). Before the data port is used, the VCU
 * must answer the literal "connect" on the handshake port with the same
 * bytes.
 */
#ifndef FIXTURELINK_PROTOCOLS_VCU_MESSAGES_HPP
#define FIXTURELINK_PROTOCOLS_VCU_MESSAGES_HPP

#include <cstdint>

#include "fixturelink/frame.hpp"

namespace fixturelink::vcu {

constexpr uint16_t MAGIC_SYNC_U16 = 0xCAFE;

constexpr uint16_t MESSAGE_FORMAT_BARE_NANO_PB = 1;
constexpr uint16_t MESSAGE_FORMAT_C_STRUCT     = 3;

// Status codes the VCU puts in its replies.
constexpr uint8_t COMM_MSG_OK                     = 1;
constexpr uint8_t COMM_MSG_GENERAL_ERROR          = 2;
constexpr uint8_t COMM_MSG_EEPROM_DATA_CRC_FAILED = 3;
constexpr uint8_t COMM_MSG_EEPROM_READ_FAILED     = 4;

constexpr const char* DEFAULT_HOST = "192.168.3.100";
constexpr uint16_t    TEST_PORT    = 8156;
constexpr uint16_t    CONNECT_PORT = 8124;
constexpr const char* CONNECT_LITERAL = "connect";
constexpr int         CONNECT_RETRIES = 15;
constexpr int         CONNECT_TIMEOUT_MS = 100;
constexpr int         CONNECT_DELAY_MS = 100;
constexpr int         RECV_TIMEOUT_MS = 100;

FrameFormat frame_format();

const char* message_format_name(uint16_t format);

} // namespace fixturelink::vcu

#endif // FIXTURELINK_PROTOCOLS_VCU_MESSAGES_HPP
