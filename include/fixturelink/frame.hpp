/**
 * @page fl-frame fixturelink Frame Layout
 * @file frame.hpp
 * @brief Header/footer layout of a framed channel, the Frame type, and the frame builder.
 *
 * @details
 * A frame on every bench link has the same shape:
 *
 *     [ header (fixed) ][ body (length-bounded) ][ footer (optional, fixed) ]
 *
 * The header and footer are themselves MessageDescriptors, so the same codec
 * that packs application messages packs the framing around them. A
 * `FrameLayout` only adds *roles*: which header field is the sync marker,
 * which is the length, where the checksum lives.
 *
 * LENGTH SEMANTICS
 * ----------------
 * - `BodyOnly`: the length field counts body bytes (safety + vehicle links).
 *   Plausible range is [1, max_frame_length].
 * - `WholeFrame`: the length field counts header + body + footer (fixture
 *   link). Plausible range is [overhead, max_frame_length], so an accepted
 *   header never implies a negative body.
 *
 * `FrameFormat` bundles the layout with the sync value, checksum policy and
 * max frame length; it is the framing half of a ChannelConfig.
 */
#ifndef FIXTURELINK_FRAME_HPP
#define FIXTURELINK_FRAME_HPP

#include <cstddef>
#include <cstdint>

#include "fixturelink/checksum.hpp"
#include "fixturelink/message_codec.hpp"

namespace fixturelink {

enum class LengthMode : uint8_t { BodyOnly, WholeFrame };

struct FrameLayout {
  MessageDescriptor header;
  MessageDescriptor footer;          ///< no fields when the checksum sits in the header
  int sync_field{0};
  int length_field{1};
  int checksum_field{2};             ///< header index, or -1 when it is in the footer
  int footer_checksum_field{-1};     ///< footer index, or -1
  int format_field{3};               ///< -1 when the layout has no format/type field
  int reserved_field{4};             ///< -1 when absent
  LengthMode length_mode{LengthMode::BodyOnly};

  size_t header_size() const { return encoded_size(header); }
  size_t footer_size() const { return encoded_size(footer); }
  size_t overhead() const { return header_size() + footer_size(); }
  size_t sync_width() const;
};

struct FrameFormat {
  FrameLayout    layout;
  uint32_t       sync_value{0};
  ChecksumPolicy checksum;
  uint32_t       max_frame_length{1000};
};

/// Scalar view of one decoded header.
struct HeaderFields {
  uint32_t sync{0};
  uint32_t length{0};
  uint32_t checksum{0};              ///< 0 when the checksum lives in the footer
  int32_t  format_id{0};
  uint32_t reserved{0};
};

struct Frame {
  uint32_t sync{0};
  uint32_t length{0};
  uint32_t checksum{0};
  int32_t  format_id{0};
  uint32_t reserved{0};
  Bytes header;
  Bytes body;
  Bytes footer;

  /// Exact bytes this frame occupied on the wire.
  Bytes wire() const;
};

/// Decode @p p (layout.header_size() bytes) into role fields.
HeaderFields read_header(const FrameLayout& layout, const uint8_t* p);

/// Is @p length trustworthy under this format?
bool length_plausible(const FrameFormat& fmt, uint32_t length);

/// Body byte count implied by a plausible length field.
size_t body_length(const FrameLayout& layout, uint32_t length);

/// Largest body build_frame() accepts under @p fmt.
size_t max_body_length(const FrameFormat& fmt);

/// Largest frame, in wire bytes, a plausible length field can announce.
size_t max_wire_length(const FrameFormat& fmt);

/// Throws EncodingError unless a body of @p body_len bytes can be framed under @p fmt.
void require_frameable(const FrameFormat& fmt, size_t body_len);

/// Checksum carried in @p footer (footer layouts only).
uint32_t read_footer_checksum(const FrameLayout& layout, const uint8_t* footer);

/**
 * @brief Serialize one frame: header, body, footer, checksum filled in.
 *
 * Throws EncodingError when the body is empty on a BodyOnly layout, or when the
 * resulting length field would exceed max_frame_length.
 */
Bytes build_frame(const FrameFormat& fmt, int32_t format_id, const Bytes& body, uint32_t reserved = 0);

} // namespace fixturelink

#endif // FIXTURELINK_FRAME_HPP
