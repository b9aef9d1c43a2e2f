// ============================================================================
// frame.cpp — implementation for frame.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/frame.hpp"
#include "fixturelink/errors.hpp"

#include <string>

namespace fixturelink {

size_t FrameLayout::sync_width() const {
  if (sync_field < 0 || static_cast<size_t>(sync_field) >= header.fields.size()) return 0;
  return field_width(header.fields[sync_field].kind);
}

Bytes Frame::wire() const {
  Bytes out;
  out.reserve(header.size() + body.size() + footer.size());
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), body.begin(), body.end());
  out.insert(out.end(), footer.begin(), footer.end());
  return out;
}

// ---------------------------------------------------------------------------
// read_header()
// -------------
// Decode a header-size window and pull out the role fields. Signed fields
// (the fixture link's i16 msg_type) keep their sign in format_id; every other
// role is read as an unsigned bit pattern.
// ---------------------------------------------------------------------------
static uint32_t role_unsigned(const FieldValues& v, int idx) {
  if (idx < 0 || static_cast<size_t>(idx) >= v.size()) return 0;
  return static_cast<uint32_t>(value_as_unsigned(v[idx]));
}

HeaderFields read_header(const FrameLayout& layout, const uint8_t* p) {
  const FieldValues v = decode(layout.header, p, layout.header_size());
  HeaderFields h;
  h.sync     = role_unsigned(v, layout.sync_field);
  h.length   = role_unsigned(v, layout.length_field);
  h.checksum = role_unsigned(v, layout.checksum_field);
  h.reserved = role_unsigned(v, layout.reserved_field);
  if (layout.format_field >= 0 && static_cast<size_t>(layout.format_field) < v.size())
    h.format_id = static_cast<int32_t>(value_as_signed(v[layout.format_field]));
  return h;
}

bool length_plausible(const FrameFormat& fmt, uint32_t length) {
  const size_t min_len = fmt.layout.length_mode == LengthMode::WholeFrame ? fmt.layout.overhead() : 1;
  return length >= min_len && length <= fmt.max_frame_length;
}

size_t body_length(const FrameLayout& layout, uint32_t length) {
  if (layout.length_mode == LengthMode::BodyOnly) return length;
  const size_t oh = layout.overhead();
  return length > oh ? length - oh : 0;
}

size_t max_body_length(const FrameFormat& fmt) {
  return body_length(fmt.layout, fmt.max_frame_length);
}

size_t max_wire_length(const FrameFormat& fmt) {
  if (fmt.layout.length_mode == LengthMode::WholeFrame) return fmt.max_frame_length;
  return size_t{fmt.max_frame_length} + fmt.layout.overhead();
}

void require_frameable(const FrameFormat& fmt, size_t body_len) {
  const FrameLayout& L = fmt.layout;
  if (L.length_mode == LengthMode::BodyOnly && body_len == 0)
    throw EncodingError(std::string(L.header.name.c_str()) + ": empty body cannot be framed");

  const size_t length = L.length_mode == LengthMode::WholeFrame ? body_len + L.overhead() : body_len;
  if (length > fmt.max_frame_length) {
    throw EncodingError(std::string(L.header.name.c_str()) + ": length " + std::to_string(length) +
                        " exceeds max_frame_length " + std::to_string(fmt.max_frame_length));
  }
}

uint32_t read_footer_checksum(const FrameLayout& layout, const uint8_t* footer) {
  if (layout.footer_checksum_field < 0) return 0;
  const FieldValues v = decode(layout.footer, footer, layout.footer_size());
  return role_unsigned(v, layout.footer_checksum_field);
}

// ---------------------------------------------------------------------------
// build_frame()
// -------------
// Two passes: encode the header with checksum = 0, compute the checksum over
// the covered ranges, then re-encode the field that carries it. The header's
// covered tail never includes the checksum field itself (coverage_offset is
// past it), so the second pass cannot change what was checksummed.
// ---------------------------------------------------------------------------
static FieldValue zero_for(const FieldSpec& f) {
  if (field_is_real(f.kind))   return 0.0;
  if (field_is_signed(f.kind)) return int64_t{0};
  return uint64_t{0};
}

Bytes build_frame(const FrameFormat& fmt, int32_t format_id, const Bytes& body, uint32_t reserved) {
  const FrameLayout& L = fmt.layout;

  require_frameable(fmt, body.size());
  const size_t length = L.length_mode == LengthMode::WholeFrame ? body.size() + L.overhead() : body.size();

  FieldValues hv;
  hv.reserve(L.header.fields.size());
  for (const auto& f : L.header.fields) hv.push_back(zero_for(f));
  hv[L.sync_field]   = uint64_t{fmt.sync_value};
  hv[L.length_field] = uint64_t{length};
  if (L.format_field >= 0) {
    if (field_is_signed(L.header.fields[L.format_field].kind)) hv[L.format_field] = int64_t{format_id};
    else hv[L.format_field] = static_cast<uint64_t>(static_cast<int64_t>(format_id));
  }
  if (L.reserved_field >= 0) hv[L.reserved_field] = uint64_t{reserved};

  Bytes header = encode(L.header, hv);
  const ByteRanges ranges = checksum_ranges(fmt.checksum, header.data(), header.size(), body.data(), body.size());
  const uint32_t crc = compute(fmt.checksum.algorithm, ranges);

  Bytes out;
  if (L.checksum_field >= 0) {
    hv[L.checksum_field] = uint64_t{crc};
    out = encode(L.header, hv);
  } else {
    out = std::move(header);
  }
  out.insert(out.end(), body.begin(), body.end());

  if (!L.footer.fields.empty()) {
    FieldValues fv;
    for (const auto& f : L.footer.fields) fv.push_back(zero_for(f));
    if (L.footer_checksum_field >= 0) fv[L.footer_checksum_field] = uint64_t{crc};
    encode_into(L.footer, fv, out);
  }
  return out;
}

} // namespace fixturelink
