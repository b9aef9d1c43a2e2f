/**
 * @page fl-codec fixturelink Message Codec
 * @file message_codec.hpp
 * @brief Declarative pack/unpack of fixed-layout binary messages.
 *
 * @details
 * PURPOSE
 * -------
 * Every binary message the bench talks (frame headers included) is described
 * as data: an ordered list of typed fields plus a numeric type id. One encoder
 * and one decoder walk that list, so adding a message type means adding a
 * table entry, never a new parser.
 *
 * FIELD KINDS
 * -----------
 * | Kind | Bytes | Signed | Decodes to |
 * |------|-------|--------|------------|
 * | U8 / U16 / U32 / U64 | 1 / 2 / 4 / 8 | no  | uint64_t |
 * | I8 / I16 / I32 / I64 | 1 / 2 / 4 / 8 | yes | int64_t  |
 * | F32 / F64            | 4 / 8         | -   | double   |
 *
 * Each field carries its own byte order, so a little-endian header may sit in
 * front of a big-endian body if a device insists.
 *
 * ERRORS
 * ------
 * - encode(): EncodingError when a value does not fit its field, when a float
 *   is given to an integer field, or when the value count is wrong.
 * - decode(): DecodingError when the blob size differs from encoded_size().
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace fixturelink;
 *   static const MessageDescriptor kRotate = make_descriptor("RotateTurntable", 0x16, {
 *       {"operation", FieldKind::U8,  Endian::Big},
 *       {"angle",     FieldKind::U16, Endian::Big},
 *   });
 *   Bytes blob = encode(kRotate, {uint64_t{1}, uint64_t{90}});   // 01 00 5A
 *   FieldValues back = decode(kRotate, blob);
 * @endcode
 */
#ifndef FIXTURELINK_MESSAGE_CODEC_HPP
#define FIXTURELINK_MESSAGE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

#include "etl/string.h"
#include "etl/vector.h"

namespace fixturelink {

using Bytes = std::vector<uint8_t>;

#ifndef FIXTURELINK_MAX_FIELDS
#define FIXTURELINK_MAX_FIELDS 16
#endif

static constexpr size_t FIELD_NAME_MAX = 24;
static constexpr size_t MESSAGE_NAME_MAX = 40;

enum class FieldKind : uint8_t { U8, I8, U16, I16, U32, I32, U64, I64, F32, F64 };
enum class Endian : uint8_t { Little, Big };

using FieldName   = etl::string<FIELD_NAME_MAX>;
using MessageName = etl::string<MESSAGE_NAME_MAX>;

size_t field_width(FieldKind kind);
bool   field_is_signed(FieldKind kind);
bool   field_is_real(FieldKind kind);
const char* field_kind_name(FieldKind kind);

struct FieldSpec {
  FieldName name;
  FieldKind kind{FieldKind::U8};
  Endian    endian{Endian::Little};

  FieldSpec() = default;
  FieldSpec(const char* n, FieldKind k, Endian e = Endian::Little) : name(n), kind(k), endian(e) {}
};

using FieldList = etl::vector<FieldSpec, FIXTURELINK_MAX_FIELDS>;

/**
 * @brief A named, fixed-layout message type.
 *
 * `type_id` is signed so transport-level descriptors (frame headers/footers)
 * can live in the same table as application messages under negative codes.
 */
struct MessageDescriptor {
  MessageName name;
  int32_t     type_id{0};
  FieldList   fields;

  /// Index of @p field_name, or -1.
  int index_of(const char* field_name) const;
};

/// Build a descriptor from a literal field list; throws EncodingError past FIXTURELINK_MAX_FIELDS.
MessageDescriptor make_descriptor(const char* name, int32_t type_id, std::initializer_list<FieldSpec> fields);

using FieldValue  = std::variant<int64_t, uint64_t, double>;
using FieldValues = std::vector<FieldValue>;

/// Byte size of one encoded message of this type.
size_t encoded_size(const MessageDescriptor& d);

Bytes       encode(const MessageDescriptor& d, const FieldValues& values);
void        encode_into(const MessageDescriptor& d, const FieldValues& values, Bytes& out);
FieldValues decode(const MessageDescriptor& d, const uint8_t* data, size_t len);
FieldValues decode(const MessageDescriptor& d, const Bytes& blob);

/// Numeric views of a FieldValue; the integer views throw DecodingError on a real value.
uint64_t value_as_unsigned(const FieldValue& v);
int64_t  value_as_signed(const FieldValue& v);
double   value_as_real(const FieldValue& v);

/**
 * @brief Descriptor + values, with by-name access.
 *
 * Fields start out as zero of the kind's natural type, so a freshly built
 * Message always encodes.
 */
class Message {
public:
  explicit Message(const MessageDescriptor& d);
  Message(const MessageDescriptor& d, const Bytes& blob);

  const MessageDescriptor& descriptor() const { return *desc_; }
  const FieldValues& values() const { return values_; }

  Message& set(const char* field, uint64_t v);
  Message& set(const char* field, int64_t v);
  Message& set(const char* field, int v) { return set(field, static_cast<int64_t>(v)); }
  Message& set(const char* field, double v);

  uint64_t as_unsigned(const char* field) const;
  int64_t  as_signed(const char* field) const;
  double   as_real(const char* field) const;

  Bytes encode() const { return fixturelink::encode(*desc_, values_); }

  /// "Name(field=value, ...)" for logs and the CLI.
  std::string to_string() const;

private:
  size_t require(const char* field) const;

  const MessageDescriptor* desc_;
  FieldValues values_;
};

} // namespace fixturelink

#endif // FIXTURELINK_MESSAGE_CODEC_HPP
