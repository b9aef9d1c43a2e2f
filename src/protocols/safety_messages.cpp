// ============================================================================
// safety_messages.cpp — implementation for safety_messages.hpp
// ============================================================================

#include "fixturelink/protocols/safety_messages.hpp"
#include "fixturelink/protocols/comm_header.hpp"
#include "fixturelink/errors.hpp"

#include <string>

namespace fixturelink::safety {

FrameFormat frame_format() { return comm::frame_format(SYNC); }

const MessageRegistry& requests() {
  static const MessageRegistry table{
      make_descriptor("CliffRequest", CLIFF, {
          {"command", FieldKind::U8}, {"response", FieldKind::U8}, {"sensor", FieldKind::U8}}),
      make_descriptor("EncoderRequest", ENCODER, {
          {"command", FieldKind::U8}, {"response", FieldKind::U8}, {"sensor", FieldKind::U8}}),
  };
  return table;
}

const MessageRegistry& responses() {
  static const MessageRegistry table{
      make_descriptor("CliffReading", CLIFF, {
          {"command", FieldKind::U8}, {"response", FieldKind::U8}, {"sensor", FieldKind::U8},
          {"millivolts", FieldKind::U16}}),
      make_descriptor("EncoderReading", ENCODER, {
          {"command", FieldKind::U8}, {"response", FieldKind::U8}, {"sensor", FieldKind::U8},
          {"speed", FieldKind::I32}}),
  };
  return table;
}

Bytes make_request(uint8_t command, uint8_t sensor) {
  const MessageDescriptor* d = requests().find(command);
  if (!d) throw EncodingError("safety: unknown command " + std::to_string(command));
  Message m(*d);
  m.set("command", uint64_t{command}).set("response", uint64_t{0}).set("sensor", uint64_t{sensor});
  return m.encode();
}

const MessageDescriptor* response_for_body(const Bytes& body) {
  if (body.empty()) return nullptr;
  const MessageDescriptor* d = responses().find(body[0]);
  if (!d || encoded_size(*d) != body.size()) return nullptr;
  return d;
}

} // namespace fixturelink::safety
