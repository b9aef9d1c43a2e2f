// ============================================================================
// message_codec.cpp — implementation for message_codec.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/message_codec.hpp"
#include "fixturelink/errors.hpp"

#include <cfloat>         // FLT_MAX for F32 range checks
#include <cmath>          // std::isfinite
#include <cstring>        // std::memcpy for float <-> raw bit patterns
#include <limits>
#include <sstream>        // std::ostringstream for Message::to_string

namespace fixturelink {

// ---------------------------------------------------------------------------
// Kind tables
// ---------------------------------------------------------------------------
size_t field_width(FieldKind kind) {
  switch (kind) {
    case FieldKind::U8:  case FieldKind::I8:  return 1;
    case FieldKind::U16: case FieldKind::I16: return 2;
    case FieldKind::U32: case FieldKind::I32: case FieldKind::F32: return 4;
    case FieldKind::U64: case FieldKind::I64: case FieldKind::F64: return 8;
  }
  return 0;
}

bool field_is_signed(FieldKind kind) {
  return kind == FieldKind::I8 || kind == FieldKind::I16 ||
         kind == FieldKind::I32 || kind == FieldKind::I64;
}

bool field_is_real(FieldKind kind) {
  return kind == FieldKind::F32 || kind == FieldKind::F64;
}

const char* field_kind_name(FieldKind kind) {
  switch (kind) {
    case FieldKind::U8:  return "u8";
    case FieldKind::I8:  return "i8";
    case FieldKind::U16: return "u16";
    case FieldKind::I16: return "i16";
    case FieldKind::U32: return "u32";
    case FieldKind::I32: return "i32";
    case FieldKind::U64: return "u64";
    case FieldKind::I64: return "i64";
    case FieldKind::F32: return "f32";
    case FieldKind::F64: return "f64";
  }
  return "?";
}

int MessageDescriptor::index_of(const char* field_name) const {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].name == field_name) return static_cast<int>(i);
  }
  return -1;
}

MessageDescriptor make_descriptor(const char* name, int32_t type_id, std::initializer_list<FieldSpec> fields) {
  MessageDescriptor d;
  d.name.assign(name);
  d.type_id = type_id;
  for (const auto& f : fields) {
    if (d.fields.full()) {
      throw EncodingError(std::string(name) + " has more than " +
                          std::to_string(FIXTURELINK_MAX_FIELDS) + " fields");
    }
    d.fields.push_back(f);
  }
  return d;
}

size_t encoded_size(const MessageDescriptor& d) {
  size_t n = 0;
  for (const auto& f : d.fields) n += field_width(f.kind);
  return n;
}

// ---------------------------------------------------------------------------
// Raw byte order helpers. Everything funnels through a uint64 bit pattern.
// ---------------------------------------------------------------------------
static void put_raw(Bytes& out, uint64_t raw, size_t width, Endian e) {
  for (size_t i = 0; i < width; ++i) {
    size_t shift = (e == Endian::Little) ? i : (width - 1 - i);
    out.push_back(static_cast<uint8_t>((raw >> (8 * shift)) & 0xFF));
  }
}

static uint64_t get_raw(const uint8_t* p, size_t width, Endian e) {
  uint64_t raw = 0;
  for (size_t i = 0; i < width; ++i) {
    size_t shift = (e == Endian::Little) ? i : (width - 1 - i);
    raw |= static_cast<uint64_t>(p[i]) << (8 * shift);
  }
  return raw;
}

static std::string field_label(const MessageDescriptor& d, const FieldSpec& f) {
  return std::string(d.name.c_str()) + "." + f.name.c_str() + " (" + field_kind_name(f.kind) + ")";
}

// ---------------------------------------------------------------------------
// to_raw()
// --------
// Range-check one value against its field and produce the bit pattern that
// put_raw() writes. Integers may arrive as either variant alternative; only
// the numeric value matters. Floats are refused for integer fields because a
// silent truncation there would be a bench bug, not a rounding choice.
// ---------------------------------------------------------------------------
static uint64_t to_raw(const MessageDescriptor& d, const FieldSpec& f, const FieldValue& v) {
  const size_t width = field_width(f.kind);

  if (field_is_real(f.kind)) {
    double x = 0.0;
    if (auto p = std::get_if<double>(&v))        x = *p;
    else if (auto p = std::get_if<int64_t>(&v))  x = static_cast<double>(*p);
    else                                         x = static_cast<double>(std::get<uint64_t>(v));

    if (f.kind == FieldKind::F32) {
      if (std::isfinite(x) && (x > FLT_MAX || x < -FLT_MAX))
        throw EncodingError(field_label(d, f) + " cannot hold " + std::to_string(x));
      float fx = static_cast<float>(x);
      uint32_t bits = 0;
      std::memcpy(&bits, &fx, sizeof bits);
      return bits;
    }
    uint64_t bits = 0;
    std::memcpy(&bits, &x, sizeof bits);
    return bits;
  }

  if (std::holds_alternative<double>(v))
    throw EncodingError(field_label(d, f) + " is an integer field, got a real value");

  if (field_is_signed(f.kind)) {
    const int64_t hi = (width == 8) ? std::numeric_limits<int64_t>::max()
                                    : (int64_t{1} << (8 * width - 1)) - 1;
    const int64_t lo = -hi - 1;
    int64_t x = 0;
    if (auto p = std::get_if<uint64_t>(&v)) {
      if (*p > static_cast<uint64_t>(hi))
        throw EncodingError(field_label(d, f) + " cannot hold " + std::to_string(*p));
      x = static_cast<int64_t>(*p);
    } else {
      x = std::get<int64_t>(v);
      if (x < lo || x > hi)
        throw EncodingError(field_label(d, f) + " cannot hold " + std::to_string(x));
    }
    const uint64_t mask = (width == 8) ? ~uint64_t{0} : ((uint64_t{1} << (8 * width)) - 1);
    return static_cast<uint64_t>(x) & mask;
  }

  const uint64_t hi = (width == 8) ? std::numeric_limits<uint64_t>::max()
                                   : ((uint64_t{1} << (8 * width)) - 1);
  if (auto p = std::get_if<int64_t>(&v)) {
    if (*p < 0 || static_cast<uint64_t>(*p) > hi)
      throw EncodingError(field_label(d, f) + " cannot hold " + std::to_string(*p));
    return static_cast<uint64_t>(*p);
  }
  uint64_t x = std::get<uint64_t>(v);
  if (x > hi) throw EncodingError(field_label(d, f) + " cannot hold " + std::to_string(x));
  return x;
}

static FieldValue from_raw(const FieldSpec& f, uint64_t raw) {
  const size_t width = field_width(f.kind);
  if (f.kind == FieldKind::F32) {
    uint32_t bits = static_cast<uint32_t>(raw);
    float fx = 0.0f;
    std::memcpy(&fx, &bits, sizeof fx);
    return static_cast<double>(fx);
  }
  if (f.kind == FieldKind::F64) {
    double x = 0.0;
    std::memcpy(&x, &raw, sizeof x);
    return x;
  }
  if (field_is_signed(f.kind)) {
    if (width < 8) {
      const uint64_t sign = uint64_t{1} << (8 * width - 1);
      if (raw & sign) raw |= ~((uint64_t{1} << (8 * width)) - 1);   // sign-extend
    }
    return static_cast<int64_t>(raw);
  }
  return raw;
}

// ---------------------------------------------------------------------------
// Public encode/decode
// ---------------------------------------------------------------------------
void encode_into(const MessageDescriptor& d, const FieldValues& values, Bytes& out) {
  if (values.size() != d.fields.size()) {
    throw EncodingError(std::string(d.name.c_str()) + " expects " + std::to_string(d.fields.size()) +
                        " values, got " + std::to_string(values.size()));
  }
  out.reserve(out.size() + encoded_size(d));
  for (size_t i = 0; i < values.size(); ++i) {
    const FieldSpec& f = d.fields[i];
    put_raw(out, to_raw(d, f, values[i]), field_width(f.kind), f.endian);
  }
}

Bytes encode(const MessageDescriptor& d, const FieldValues& values) {
  Bytes out;
  encode_into(d, values, out);
  return out;
}

FieldValues decode(const MessageDescriptor& d, const uint8_t* data, size_t len) {
  const size_t want = encoded_size(d);
  if (len != want) {
    throw DecodingError(std::string(d.name.c_str()) + " needs " + std::to_string(want) +
                        " bytes, got " + std::to_string(len));
  }
  FieldValues values;
  values.reserve(d.fields.size());
  size_t off = 0;
  for (const auto& f : d.fields) {
    const size_t w = field_width(f.kind);
    values.push_back(from_raw(f, get_raw(data + off, w, f.endian)));
    off += w;
  }
  return values;
}

FieldValues decode(const MessageDescriptor& d, const Bytes& blob) {
  return decode(d, blob.data(), blob.size());
}

uint64_t value_as_unsigned(const FieldValue& v) {
  if (auto p = std::get_if<uint64_t>(&v)) return *p;
  if (auto p = std::get_if<int64_t>(&v))  return static_cast<uint64_t>(*p);
  throw DecodingError("real value read as unsigned");
}

int64_t value_as_signed(const FieldValue& v) {
  if (auto p = std::get_if<int64_t>(&v))  return *p;
  if (auto p = std::get_if<uint64_t>(&v)) return static_cast<int64_t>(*p);
  throw DecodingError("real value read as signed");
}

double value_as_real(const FieldValue& v) {
  if (auto p = std::get_if<double>(&v))  return *p;
  if (auto p = std::get_if<int64_t>(&v)) return static_cast<double>(*p);
  return static_cast<double>(std::get<uint64_t>(v));
}

// ---------------------------------------------------------------------------
// Message
// ---------------------------------------------------------------------------
static FieldValue zero_of(FieldKind kind) {
  if (field_is_real(kind))   return 0.0;
  if (field_is_signed(kind)) return int64_t{0};
  return uint64_t{0};
}

Message::Message(const MessageDescriptor& d) : desc_(&d) {
  values_.reserve(d.fields.size());
  for (const auto& f : d.fields) values_.push_back(zero_of(f.kind));
}

Message::Message(const MessageDescriptor& d, const Bytes& blob)
: desc_(&d), values_(fixturelink::decode(d, blob)) {}

size_t Message::require(const char* field) const {
  int idx = desc_->index_of(field);
  if (idx < 0) throw EncodingError(std::string(desc_->name.c_str()) + " has no field '" + field + "'");
  return static_cast<size_t>(idx);
}

Message& Message::set(const char* field, uint64_t v) { values_[require(field)] = v; return *this; }
Message& Message::set(const char* field, int64_t v)  { values_[require(field)] = v; return *this; }
Message& Message::set(const char* field, double v)   { values_[require(field)] = v; return *this; }

uint64_t Message::as_unsigned(const char* field) const { return value_as_unsigned(values_[require(field)]); }
int64_t  Message::as_signed(const char* field) const   { return value_as_signed(values_[require(field)]); }
double   Message::as_real(const char* field) const     { return value_as_real(values_[require(field)]); }

std::string Message::to_string() const {
  std::ostringstream os;
  os << desc_->name.c_str() << "(";
  for (size_t i = 0; i < values_.size(); ++i) {
    if (i) os << ", ";
    os << desc_->fields[i].name.c_str() << "=";
    std::visit([&os](auto x) { os << x; }, values_[i]);
  }
  os << ")";
  return os.str();
}

} // namespace fixturelink
