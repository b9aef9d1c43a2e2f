// ============================================================================
// comm_header.cpp — implementation for comm_header.hpp
// ============================================================================

#include "fixturelink/protocols/comm_header.hpp"

namespace fixturelink::comm {

static FrameLayout make_layout() {
  FrameLayout L;
  L.header = make_descriptor("CommMsgHeader", -1, {
      {"sync",           FieldKind::U16},
      {"length",         FieldKind::U16},
      {"crc",            FieldKind::U32},
      {"message_format", FieldKind::U16},
      {"reserved",       FieldKind::U16},
  });
  L.sync_field     = 0;
  L.length_field   = 1;
  L.checksum_field = 2;
  L.format_field   = 3;
  L.reserved_field = 4;
  L.length_mode    = LengthMode::BodyOnly;
  return L;
}

const FrameLayout& frame_layout() {
  static const FrameLayout layout = make_layout();
  return layout;
}

FrameFormat frame_format(uint16_t sync) {
  FrameFormat f;
  f.layout = frame_layout();
  f.sync_value = sync;
  f.checksum.algorithm = ChecksumAlgorithm::Crc32Chained;
  f.checksum.coverage_offset = CRC_OFFSET;
  f.max_frame_length = MAX_MESSAGE_BODY_LENGTH;
  return f;
}

} // namespace fixturelink::comm
