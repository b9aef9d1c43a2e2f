// ============================================================================
// vcu_messages.cpp — implementation for vcu_messages.hpp
// ============================================================================

#include "fixturelink/protocols/vcu_messages.hpp"
#include "fixturelink/protocols/comm_header.hpp"

namespace fixturelink::vcu {

FrameFormat frame_format() { return comm::frame_format(MAGIC_SYNC_U16); }

const char* message_format_name(uint16_t format) {
  switch (format) {
    case MESSAGE_FORMAT_BARE_NANO_PB: return "nanopb";
    case MESSAGE_FORMAT_C_STRUCT:     return "c-struct";
    default:                          return "unknown";
  }
}

} // namespace fixturelink::vcu
