// ============================================================================
// fixture_messages.cpp — implementation for fixture_messages.hpp
// ============================================================================

#include "fixturelink/protocols/fixture_messages.hpp"

namespace fixturelink::fixture {

static constexpr Endian BE = Endian::Big;

const char* status_name(uint8_t status) {
  switch (status) {
    case SUCCESS:         return "SUCCESS";
    case GENERAL_FAILURE: return "GENERAL_FAILURE";
    case TIMEOUT_EXPIRED: return "TIMEOUT_EXPIRED";
    default:              return "UNKNOWN";
  }
}

const MessageRegistry& registry() {
  static const MessageRegistry table{
      make_descriptor("TransportHeader", TRANSPORT_HEADER, {
          {"sync_word", FieldKind::U32, BE}, {"length", FieldKind::U16, BE}, {"msg_type", FieldKind::I16, BE}}),
      make_descriptor("TransportFooter", TRANSPORT_FOOTER, {
          {"crc16", FieldKind::U16, BE}}),
      make_descriptor("ActuateCliffSensorDoor", ACTUATE_CLIFF_SENSOR_DOOR, {
          {"door_number", FieldKind::U8, BE}, {"close_open", FieldKind::U8, BE}}),
      make_descriptor("ActuateCliffSensorDoorStatus", ACTUATE_CLIFF_SENSOR_DOOR_STATUS, {
          {"status", FieldKind::U8, BE}}),
      make_descriptor("ReadEncoderCount", READ_ENCODER_COUNT, {
          {"left_right", FieldKind::U8, BE}}),
      make_descriptor("EncoderCount", ENCODER_COUNT, {
          {"status", FieldKind::U8, BE}, {"count", FieldKind::U32, BE}}),
      make_descriptor("WaitForTurntable", WAIT_FOR_TURNTABLE, {
          {"timeout_seconds", FieldKind::U8, BE}}),
      make_descriptor("WaitForTurntableStatus", WAIT_FOR_TURNTABLE_STATUS, {
          {"status", FieldKind::U8, BE}}),
      make_descriptor("RotateTurntable", ROTATE_TURNTABLE, {
          {"operation", FieldKind::U8, BE}, {"angle", FieldKind::U16, BE}}),
      make_descriptor("RotateTurntableStatus", ROTATE_TURNTABLE_STATUS, {
          {"status", FieldKind::U8, BE}}),
      make_descriptor("GetTurntableAngle", GET_TURNTABLE_ANGLE, {}),
      make_descriptor("TurntableAngleRsp", TURNTABLE_ANGLE_RSP, {
          {"angle", FieldKind::U16, BE}}),
  };
  return table;
}

static FrameLayout make_layout() {
  FrameLayout L;
  L.header = *registry().find(TRANSPORT_HEADER);
  L.footer = *registry().find(TRANSPORT_FOOTER);
  L.sync_field            = 0;
  L.length_field          = 1;
  L.format_field          = 2;
  L.checksum_field        = -1;
  L.footer_checksum_field = 0;
  L.reserved_field        = -1;
  L.length_mode           = LengthMode::WholeFrame;
  return L;
}

const FrameLayout& frame_layout() {
  static const FrameLayout layout = make_layout();
  return layout;
}

FrameFormat frame_format() {
  FrameFormat f;
  f.layout = frame_layout();
  f.sync_value = SYNC_WORD;
  f.checksum.algorithm = ChecksumAlgorithm::Crc16Kermit;
  f.checksum.coverage_offset = 0;
  f.max_frame_length = MAX_FRAME_LENGTH;
  return f;
}

size_t transport_overhead() { return frame_layout().overhead(); }

} // namespace fixturelink::fixture
