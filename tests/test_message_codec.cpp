#include <doctest/doctest.h>
#include <cstdint>
#include <limits>
#include "fixturelink/errors.hpp"
#include "fixturelink/message_codec.hpp"

using namespace fixturelink;

static const MessageDescriptor& sample() {
    static const MessageDescriptor d = make_descriptor("Sample", 7, {
        {"a", FieldKind::U8},
        {"b", FieldKind::U16, Endian::Little},
        {"c", FieldKind::U16, Endian::Big},
        {"d", FieldKind::I32},
    });
    return d;
}

TEST_CASE("Encoded size is the sum of field widths") {
    CHECK(encoded_size(sample()) == 1 + 2 + 2 + 4);
    CHECK(field_width(FieldKind::F64) == 8);
    CHECK(field_width(FieldKind::I8) == 1);
}

TEST_CASE("Encode honours per-field byte order") {
    FieldValues v{uint64_t{0xAB}, uint64_t{0x1234}, uint64_t{0x1234}, int64_t{-2}};
    Bytes out = encode(sample(), v);
    Bytes expected{0xAB, 0x34, 0x12, 0x12, 0x34, 0xFE, 0xFF, 0xFF, 0xFF};
    CHECK(out == expected);
}

TEST_CASE("Decode sign-extends signed fields and keeps unsigned ones positive") {
    Bytes blob{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x80};
    FieldValues v = decode(sample(), blob);
    REQUIRE(v.size() == 4);
    CHECK(value_as_unsigned(v[0]) == 0xFF);
    CHECK(value_as_unsigned(v[1]) == 0xFFFF);
    CHECK(value_as_unsigned(v[2]) == 0xFF00);
    CHECK(value_as_signed(v[3]) == INT32_MIN);
}

TEST_CASE("Values that overflow their field are refused") {
    const MessageDescriptor d = make_descriptor("Narrow", 1, {{"x", FieldKind::U8}});
    FieldValues too_big{uint64_t{256}};
    FieldValues negative{int64_t{-1}};
    FieldValues real{0.5};
    CHECK_THROWS_AS(encode(d, too_big), EncodingError);
    CHECK_THROWS_AS(encode(d, negative), EncodingError);
    CHECK_THROWS_AS(encode(d, real), EncodingError);

    const MessageDescriptor s = make_descriptor("Signed", 2, {{"y", FieldKind::I8}});
    FieldValues low{int64_t{-129}};
    FieldValues high{uint64_t{128}};
    FieldValues edge{int64_t{-128}};
    CHECK_THROWS_AS(encode(s, low), EncodingError);
    CHECK_THROWS_AS(encode(s, high), EncodingError);
    CHECK(encode(s, edge) == Bytes{0x80});
}

TEST_CASE("Value count must match the descriptor") {
    FieldValues short_list{uint64_t{1}};
    CHECK_THROWS_AS(encode(sample(), short_list), EncodingError);
}

TEST_CASE("Decode requires the exact byte count") {
    Bytes short_blob(8, 0);
    Bytes long_blob(10, 0);
    CHECK_THROWS_AS(decode(sample(), short_blob), DecodingError);
    CHECK_THROWS_AS(decode(sample(), long_blob), DecodingError);
}

TEST_CASE("Real fields carry IEEE bit patterns") {
    const MessageDescriptor d = make_descriptor("Reals", 3, {
        {"f", FieldKind::F32}, {"g", FieldKind::F64, Endian::Big}});
    FieldValues v{1.5, -0.25};
    Bytes out = encode(d, v);
    REQUIRE(out.size() == 12);
    CHECK(out[3] == 0x3F);       // 1.5f = 0x3FC00000, little endian
    CHECK(out[2] == 0xC0);
    CHECK(out[4] == 0xBF);       // -0.25 = 0xBFD0..., big endian

    FieldValues back = decode(d, out);
    CHECK(value_as_real(back[0]) == doctest::Approx(1.5));
    CHECK(value_as_real(back[1]) == doctest::Approx(-0.25));
    CHECK_THROWS_AS(value_as_unsigned(back[0]), DecodingError);
}

TEST_CASE("Message starts zeroed and is addressed by field name") {
    Message m(sample());
    CHECK(m.encode() == Bytes(9, 0x00));

    m.set("a", uint64_t{3}).set("d", -5);
    CHECK(m.as_unsigned("a") == 3);
    CHECK(m.as_signed("d") == -5);
    CHECK(m.to_string() == "Sample(a=3, b=0, c=0, d=-5)");
    CHECK_THROWS_AS(m.set("nope", uint64_t{1}), EncodingError);

    Message copy(sample(), m.encode());
    CHECK(copy.as_signed("d") == -5);
}

TEST_CASE("index_of finds fields by name") {
    CHECK(sample().index_of("c") == 2);
    CHECK(sample().index_of("missing") == -1);
}

static MessageDescriptor every_kind(Endian e) {
    return make_descriptor("EveryKind", 9, {
        {"u8", FieldKind::U8, e},   {"i8", FieldKind::I8, e},
        {"u16", FieldKind::U16, e}, {"i16", FieldKind::I16, e},
        {"u32", FieldKind::U32, e}, {"i32", FieldKind::I32, e},
        {"u64", FieldKind::U64, e}, {"i64", FieldKind::I64, e},
        {"f32", FieldKind::F32, e}, {"f64", FieldKind::F64, e},
    });
}

static void check_decodes_back(const MessageDescriptor& d, const FieldValues& in) {
    const FieldValues out = decode(d, encode(d, in));
    REQUIRE(out.size() == in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        CAPTURE(i);
        const FieldKind k = d.fields[i].kind;
        if (field_is_real(k))        CHECK(value_as_real(out[i]) == value_as_real(in[i]));
        else if (field_is_signed(k)) CHECK(value_as_signed(out[i]) == value_as_signed(in[i]));
        else                         CHECK(value_as_unsigned(out[i]) == value_as_unsigned(in[i]));
    }
}

TEST_CASE("Every field kind decodes back to its value at the range limits") {
    const FieldValues upper{
        uint64_t{UINT8_MAX}, int64_t{INT8_MAX}, uint64_t{UINT16_MAX}, int64_t{INT16_MAX},
        uint64_t{UINT32_MAX}, int64_t{INT32_MAX}, uint64_t{UINT64_MAX}, int64_t{INT64_MAX},
        double{std::numeric_limits<float>::max()}, std::numeric_limits<double>::max()};
    const FieldValues lower{
        uint64_t{0}, int64_t{INT8_MIN}, uint64_t{0}, int64_t{INT16_MIN},
        uint64_t{0}, int64_t{INT32_MIN}, uint64_t{0}, int64_t{INT64_MIN},
        double{std::numeric_limits<float>::denorm_min()}, std::numeric_limits<double>::lowest()};
    const FieldValues ordinary{
        uint64_t{0x5A}, int64_t{-1}, uint64_t{0x1234}, int64_t{-2}, uint64_t{0xDEADBEEF},
        int64_t{-123456}, uint64_t{0x0102030405060708}, int64_t{-0x0102030405060708},
        -1.5, 3.141592653589793};

    for (const Endian e : {Endian::Little, Endian::Big}) {
        const int endian = static_cast<int>(e);
        CAPTURE(endian);
        const MessageDescriptor d = every_kind(e);
        check_decodes_back(d, upper);
        check_decodes_back(d, lower);
        check_decodes_back(d, ordinary);
    }
}

TEST_CASE("Big-endian signed fields put the sign byte first") {
    const MessageDescriptor d = make_descriptor("Be", 3, {{"x", FieldKind::I16, Endian::Big}});
    FieldValues v{int64_t{INT16_MIN}};
    const Bytes expected{0x80, 0x00};
    CHECK(encode(d, v) == expected);
    CHECK(value_as_signed(decode(d, expected)[0]) == INT16_MIN);
}
