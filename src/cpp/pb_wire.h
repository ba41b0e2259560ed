#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

// Protobuf wire-level primitives over untrusted byte ranges.
// Nothing here allocates, throws or reads outside the span it is given.

namespace pb {

enum class WireType : uint8_t {
    VARINT           = 0,
    FIXED64          = 1,
    LENGTH_DELIMITED = 2,
    FIXED32          = 5,
};

enum class DecodeStatus {
    OK,
    TRUNCATED,   // buffer ended before the value completed
    MALFORMED,   // structurally invalid (bad wire type, over-long varint, ...)
};

constexpr size_t MAX_VARINT_BYTES = 10;
constexpr uint64_t MAX_FIELD_NUMBER = (1u << 29) - 1;

const char* wire_type_name(WireType wt);
const char* status_name(DecodeStatus s);

// ByteSpan: read-only view into the top-level payload.
// origin() is the absolute offset of data()[0] in that payload, so nested
// spans still know where they sit for tree highlighting. The view never
// owns the bytes; it is valid only for the duration of one dissect call.
class ByteSpan {
public:
    ByteSpan() = default;
    ByteSpan(const uint8_t* data, size_t len, size_t origin = 0)
        : data_(data), size_(len), origin_(origin) {}

    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t origin() const { return origin_; }

    uint8_t operator[](size_t i) const { return data_[i]; }

    // Clamped to the view: never yields bytes outside [0, size()).
    ByteSpan subspan(size_t offset, size_t len) const;
    ByteSpan subspan(size_t offset) const;

    std::string to_string() const;

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t origin_ = 0;
};

// Result of one primitive decode. On failure bytes_consumed is 0 and
// value is default-initialised.
template <typename T>
struct Decoded {
    T value{};
    size_t bytes_consumed = 0;
    DecodeStatus status = DecodeStatus::OK;

    bool ok() const { return status == DecodeStatus::OK; }

    static Decoded fail(DecodeStatus s) {
        Decoded d;
        d.status = s;
        return d;
    }
};

struct Tag {
    uint32_t field_number = 0;
    WireType wire_type = WireType::VARINT;
};

// ── Primitive codec ──

// Base-128 little-endian varint, at most MAX_VARINT_BYTES bytes.
Decoded<uint64_t> decode_varint(const ByteSpan& buf, size_t offset);

// Zigzag-encoded signed varint (sint32/sint64).
Decoded<int64_t> decode_zigzag(const ByteSpan& buf, size_t offset);

Decoded<uint32_t> decode_fixed32(const ByteSpan& buf, size_t offset);
Decoded<uint64_t> decode_fixed64(const ByteSpan& buf, size_t offset);
Decoded<float> decode_float32(const ByteSpan& buf, size_t offset);
Decoded<double> decode_float64(const ByteSpan& buf, size_t offset);

inline int64_t zigzag_decode(uint64_t v) {
    return static_cast<int64_t>(v >> 1) ^ -static_cast<int64_t>(v & 1);
}

inline uint64_t zigzag_encode(int64_t v) {
    return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

// ── Tag / field framer ──

bool is_valid_wire_type(uint64_t raw);

// Splits the tag varint into (field_number, wire_type). Wire types 3/4
// (groups), 6 and 7 are MALFORMED, as are field numbers outside
// [1, MAX_FIELD_NUMBER].
Decoded<Tag> decode_tag(const ByteSpan& buf, size_t offset);

// Varint length followed by that many bytes. value is the payload span;
// bytes_consumed covers the length prefix and the payload.
Decoded<ByteSpan> decode_length_delimited(const ByteSpan& buf, size_t offset);

// Steps over one value of the given wire type without interpreting it.
// value is the raw span the value occupies (for LENGTH_DELIMITED, the
// payload only; bytes_consumed still includes the prefix).
Decoded<ByteSpan> skip_value(const ByteSpan& buf, size_t offset, WireType wire_type);

} // namespace pb
