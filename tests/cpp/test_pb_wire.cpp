#include <gtest/gtest.h>

#include "pb_wire.h"
#include "proto_writer.h"

#include <cmath>
#include <limits>

using namespace pb;
using testing_pb::Bytes;

static ByteSpan span(const Bytes& b) { return ByteSpan(b.data(), b.size()); }

// ── Varint ──

TEST(Varint, RoundTripsEveryEncodedWidth) {
    // One value per encoded width, 1..10 bytes
    const uint64_t values[] = {
        0, 127,
        128, (1ull << 14) - 1,
        1ull << 14, (1ull << 21) + 5,
        1ull << 28, 1ull << 35, 1ull << 42, 1ull << 49, 1ull << 56,
        1ull << 63, std::numeric_limits<uint64_t>::max(),
    };
    for (uint64_t v : values) {
        Bytes enc = testing_pb::varint_bytes(v);
        auto d = decode_varint(span(enc), 0);
        ASSERT_TRUE(d.ok()) << v;
        EXPECT_EQ(d.value, v);
        EXPECT_EQ(d.bytes_consumed, enc.size());
    }
    EXPECT_EQ(testing_pb::varint_bytes(std::numeric_limits<uint64_t>::max()).size(), 10u);
}

TEST(Varint, DecodesAtOffset) {
    Bytes b{0xFF, 0xAC, 0x02, 0xFF};
    auto d = decode_varint(span(b), 1);
    ASSERT_TRUE(d.ok());
    EXPECT_EQ(d.value, 300u);
    EXPECT_EQ(d.bytes_consumed, 2u);
}

TEST(Varint, EveryShortPrefixIsTruncated) {
    Bytes enc = testing_pb::varint_bytes(std::numeric_limits<uint64_t>::max());
    for (size_t n = 0; n < enc.size(); ++n) {
        Bytes prefix(enc.begin(), enc.begin() + n);
        auto d = decode_varint(span(prefix), 0);
        EXPECT_EQ(d.status, DecodeStatus::TRUNCATED) << n;
        EXPECT_EQ(d.bytes_consumed, 0u);
    }
}

TEST(Varint, OffsetPastEndIsTruncated) {
    Bytes b{0x01};
    EXPECT_EQ(decode_varint(span(b), 1).status, DecodeStatus::TRUNCATED);
    EXPECT_EQ(decode_varint(span(b), 100).status, DecodeStatus::TRUNCATED);
}

TEST(Varint, ElevenBytesIsMalformed) {
    Bytes b(11, 0x80);
    b.push_back(0x01);
    auto d = decode_varint(span(b), 0);
    EXPECT_EQ(d.status, DecodeStatus::MALFORMED);
    EXPECT_EQ(d.bytes_consumed, 0u);
}

TEST(Varint, TenContinuationBytesIsMalformed) {
    Bytes b(10, 0xFF);
    EXPECT_EQ(decode_varint(span(b), 0).status, DecodeStatus::MALFORMED);
}

// ── Zigzag ──

TEST(Zigzag, StandardTable) {
    EXPECT_EQ(zigzag_encode(0), 0u);
    EXPECT_EQ(zigzag_encode(-1), 1u);
    EXPECT_EQ(zigzag_encode(1), 2u);
    EXPECT_EQ(zigzag_encode(-2), 3u);
    EXPECT_EQ(zigzag_encode(2147483647), 4294967294u);
    EXPECT_EQ(zigzag_encode(-2147483648LL), 4294967295u);
}

TEST(Zigzag, DecodeFromWire) {
    const struct { uint8_t byte; int64_t expected; } table[] = {
        {0x00, 0}, {0x01, -1}, {0x02, 1}, {0x03, -2}, {0x04, 2},
    };
    for (const auto& row : table) {
        Bytes b{row.byte};
        auto d = decode_zigzag(span(b), 0);
        ASSERT_TRUE(d.ok());
        EXPECT_EQ(d.value, row.expected);
        EXPECT_EQ(d.bytes_consumed, 1u);
    }
}

TEST(Zigzag, ExtremesSurvive) {
    Bytes max_enc = testing_pb::varint_bytes(zigzag_encode(std::numeric_limits<int64_t>::max()));
    Bytes min_enc = testing_pb::varint_bytes(zigzag_encode(std::numeric_limits<int64_t>::min()));
    EXPECT_EQ(decode_zigzag(span(max_enc), 0).value, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(decode_zigzag(span(min_enc), 0).value, std::numeric_limits<int64_t>::min());
}

TEST(Zigzag, PropagatesTruncation) {
    Bytes b{0x80};
    EXPECT_EQ(decode_zigzag(span(b), 0).status, DecodeStatus::TRUNCATED);
}

// ── Fixed width ──

TEST(Fixed, LittleEndianIntegers) {
    Bytes b{0x78, 0x56, 0x34, 0x12, 0xEF, 0xCD, 0xAB, 0x90};
    EXPECT_EQ(decode_fixed32(span(b), 0).value, 0x12345678u);
    EXPECT_EQ(decode_fixed64(span(b), 0).value, 0x90ABCDEF12345678ull);
    EXPECT_EQ(decode_fixed32(span(b), 4).value, 0x90ABCDEFu);
}

TEST(Fixed, ShortBufferIsTruncated) {
    Bytes b{1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(decode_fixed64(span(b), 0).status, DecodeStatus::TRUNCATED);
    EXPECT_EQ(decode_fixed32(span(b), 4).status, DecodeStatus::TRUNCATED);
    EXPECT_EQ(decode_float64(span(b), 0).status, DecodeStatus::TRUNCATED);
    EXPECT_EQ(decode_float32(span(b), 5).status, DecodeStatus::TRUNCATED);
    EXPECT_TRUE(decode_fixed32(span(b), 3).ok());
}

TEST(Fixed, FloatsPassThroughUnvalidated) {
    testing_pb::Writer w;
    w.float64(1, -75.123456);
    // skip the 1-byte tag
    EXPECT_DOUBLE_EQ(decode_float64(span(w.data()), 1).value, -75.123456);

    Bytes nan_bits{0x00, 0x00, 0xC0, 0x7F};
    auto f = decode_float32(span(nan_bits), 0);
    ASSERT_TRUE(f.ok());
    EXPECT_TRUE(std::isnan(f.value));

    Bytes inf_bits{0, 0, 0, 0, 0, 0, 0xF0, 0x7F};
    EXPECT_TRUE(std::isinf(decode_float64(span(inf_bits), 0).value));
}

// ── Tags ──

TEST(Tag, SplitsFieldAndWireType) {
    Bytes b{0x0A};
    auto t = decode_tag(span(b), 0);
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(t.value.field_number, 1u);
    EXPECT_EQ(t.value.wire_type, WireType::LENGTH_DELIMITED);

    Bytes multi = testing_pb::varint_bytes((42ull << 3) | 5);
    auto t2 = decode_tag(span(multi), 0);
    ASSERT_TRUE(t2.ok());
    EXPECT_EQ(t2.value.field_number, 42u);
    EXPECT_EQ(t2.value.wire_type, WireType::FIXED32);
    EXPECT_EQ(t2.bytes_consumed, 2u);
}

TEST(Tag, RejectsUnknownWireTypes) {
    for (uint8_t wt : {3, 4, 6, 7}) {
        Bytes b{static_cast<uint8_t>((1 << 3) | wt)};
        EXPECT_EQ(decode_tag(span(b), 0).status, DecodeStatus::MALFORMED) << int(wt);
    }
}

TEST(Tag, RejectsFieldNumberZeroAndOverflow) {
    Bytes zero{0x02};
    EXPECT_EQ(decode_tag(span(zero), 0).status, DecodeStatus::MALFORMED);

    Bytes too_big = testing_pb::varint_bytes(((MAX_FIELD_NUMBER + 1) << 3) | 0);
    EXPECT_EQ(decode_tag(span(too_big), 0).status, DecodeStatus::MALFORMED);

    Bytes largest = testing_pb::varint_bytes((MAX_FIELD_NUMBER << 3) | 0);
    auto ok = decode_tag(span(largest), 0);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value.field_number, MAX_FIELD_NUMBER);
}

// ── Length-delimited / skip ──

TEST(LengthDelimited, ReturnsPayloadSpan) {
    Bytes b{0x03, 'a', 'b', 'c', 'x'};
    auto d = decode_length_delimited(span(b), 0);
    ASSERT_TRUE(d.ok());
    EXPECT_EQ(d.value.to_string(), "abc");
    EXPECT_EQ(d.value.origin(), 1u);
    EXPECT_EQ(d.bytes_consumed, 4u);
}

TEST(LengthDelimited, LengthBeyondBufferIsTruncated) {
    Bytes b{0x05, 'a', 'b'};
    auto d = decode_length_delimited(span(b), 0);
    EXPECT_EQ(d.status, DecodeStatus::TRUNCATED);
    EXPECT_EQ(d.bytes_consumed, 0u);
}

TEST(LengthDelimited, HugeLengthDoesNotOverflow) {
    Bytes b = testing_pb::varint_bytes(std::numeric_limits<uint64_t>::max());
    b.push_back('a');
    EXPECT_EQ(decode_length_delimited(span(b), 0).status, DecodeStatus::TRUNCATED);
}

TEST(SkipValue, WidthPerWireType) {
    Bytes b{0xAC, 0x02, 1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(skip_value(span(b), 0, WireType::VARINT).bytes_consumed, 2u);
    EXPECT_EQ(skip_value(span(b), 2, WireType::FIXED64).bytes_consumed, 8u);
    EXPECT_EQ(skip_value(span(b), 2, WireType::FIXED32).bytes_consumed, 4u);
    EXPECT_EQ(skip_value(span(b), 3, WireType::FIXED64).status, DecodeStatus::TRUNCATED);

    Bytes ld{0x02, 'h', 'i'};
    auto s = skip_value(span(ld), 0, WireType::LENGTH_DELIMITED);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.bytes_consumed, 3u);
    EXPECT_EQ(s.value.to_string(), "hi");
}

// ── ByteSpan ──

TEST(ByteSpan, SubspanIsClampedAndKeepsOrigin) {
    Bytes b{1, 2, 3, 4, 5};
    ByteSpan s(b.data(), b.size(), 100);
    ByteSpan sub = s.subspan(2, 10);
    EXPECT_EQ(sub.size(), 3u);
    EXPECT_EQ(sub.origin(), 102u);
    EXPECT_EQ(sub[0], 3);

    EXPECT_TRUE(s.subspan(9, 1).empty());
    EXPECT_EQ(s.subspan(1).size(), 4u);
}
