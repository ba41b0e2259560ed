#include "pb_wire.h"
#include "util.h"

namespace pb {

const char* wire_type_name(WireType wt) {
    switch (wt) {
    case WireType::VARINT:           return "varint";
    case WireType::FIXED64:          return "fixed64";
    case WireType::LENGTH_DELIMITED: return "length-delimited";
    case WireType::FIXED32:          return "fixed32";
    }
    return "unknown";
}

const char* status_name(DecodeStatus s) {
    switch (s) {
    case DecodeStatus::OK:        return "ok";
    case DecodeStatus::TRUNCATED: return "truncated";
    case DecodeStatus::MALFORMED: return "malformed";
    }
    return "unknown";
}

// ── ByteSpan ──

ByteSpan ByteSpan::subspan(size_t offset, size_t len) const {
    if (offset >= size_) return ByteSpan(data_ + size_, 0, origin_ + size_);
    size_t avail = size_ - offset;
    if (len > avail) len = avail;
    return ByteSpan(data_ + offset, len, origin_ + offset);
}

ByteSpan ByteSpan::subspan(size_t offset) const {
    return subspan(offset, size_);
}

std::string ByteSpan::to_string() const {
    if (size_ == 0) return {};
    return std::string(reinterpret_cast<const char*>(data_), size_);
}

// ── Primitive codec ──

Decoded<uint64_t> decode_varint(const ByteSpan& buf, size_t offset) {
    uint64_t value = 0;
    size_t i = 0;

    while (true) {
        if (offset >= buf.size() || i >= buf.size() - offset) {
            return Decoded<uint64_t>::fail(DecodeStatus::TRUNCATED);
        }

        uint8_t byte = buf[offset + i];
        // The 10th byte only carries bit 63; higher bits are discarded
        value |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
        ++i;

        if ((byte & 0x80) == 0) break;

        if (i >= MAX_VARINT_BYTES) {
            return Decoded<uint64_t>::fail(DecodeStatus::MALFORMED);
        }
    }

    Decoded<uint64_t> d;
    d.value = value;
    d.bytes_consumed = i;
    return d;
}

Decoded<int64_t> decode_zigzag(const ByteSpan& buf, size_t offset) {
    auto raw = decode_varint(buf, offset);
    if (!raw.ok()) return Decoded<int64_t>::fail(raw.status);

    Decoded<int64_t> d;
    d.value = zigzag_decode(raw.value);
    d.bytes_consumed = raw.bytes_consumed;
    return d;
}

static bool has_bytes(const ByteSpan& buf, size_t offset, size_t n) {
    return offset <= buf.size() && n <= buf.size() - offset;
}

Decoded<uint32_t> decode_fixed32(const ByteSpan& buf, size_t offset) {
    if (!has_bytes(buf, offset, 4)) return Decoded<uint32_t>::fail(DecodeStatus::TRUNCATED);
    Decoded<uint32_t> d;
    d.value = util::read_u32_le(buf.data() + offset);
    d.bytes_consumed = 4;
    return d;
}

Decoded<uint64_t> decode_fixed64(const ByteSpan& buf, size_t offset) {
    if (!has_bytes(buf, offset, 8)) return Decoded<uint64_t>::fail(DecodeStatus::TRUNCATED);
    Decoded<uint64_t> d;
    d.value = util::read_u64_le(buf.data() + offset);
    d.bytes_consumed = 8;
    return d;
}

Decoded<float> decode_float32(const ByteSpan& buf, size_t offset) {
    if (!has_bytes(buf, offset, 4)) return Decoded<float>::fail(DecodeStatus::TRUNCATED);
    Decoded<float> d;
    d.value = util::read_f32_le(buf.data() + offset);
    d.bytes_consumed = 4;
    return d;
}

Decoded<double> decode_float64(const ByteSpan& buf, size_t offset) {
    if (!has_bytes(buf, offset, 8)) return Decoded<double>::fail(DecodeStatus::TRUNCATED);
    Decoded<double> d;
    d.value = util::read_f64_le(buf.data() + offset);
    d.bytes_consumed = 8;
    return d;
}

// ── Tag / field framer ──

bool is_valid_wire_type(uint64_t raw) {
    return raw == 0 || raw == 1 || raw == 2 || raw == 5;
}

Decoded<Tag> decode_tag(const ByteSpan& buf, size_t offset) {
    auto raw = decode_varint(buf, offset);
    if (!raw.ok()) return Decoded<Tag>::fail(raw.status);

    uint64_t wire = raw.value & 0x7;
    uint64_t field = raw.value >> 3;
    if (!is_valid_wire_type(wire)) return Decoded<Tag>::fail(DecodeStatus::MALFORMED);
    if (field == 0 || field > MAX_FIELD_NUMBER) return Decoded<Tag>::fail(DecodeStatus::MALFORMED);

    Decoded<Tag> d;
    d.value.field_number = static_cast<uint32_t>(field);
    d.value.wire_type = static_cast<WireType>(wire);
    d.bytes_consumed = raw.bytes_consumed;
    return d;
}

Decoded<ByteSpan> decode_length_delimited(const ByteSpan& buf, size_t offset) {
    auto len = decode_varint(buf, offset);
    if (!len.ok()) return Decoded<ByteSpan>::fail(len.status);

    size_t start = offset + len.bytes_consumed;
    // offset + prefix + length <= buffer size, written to avoid overflow
    if (len.value > buf.size() - start) {
        return Decoded<ByteSpan>::fail(DecodeStatus::TRUNCATED);
    }

    size_t payload_len = static_cast<size_t>(len.value);
    Decoded<ByteSpan> d;
    d.value = buf.subspan(start, payload_len);
    d.bytes_consumed = len.bytes_consumed + payload_len;
    return d;
}

Decoded<ByteSpan> skip_value(const ByteSpan& buf, size_t offset, WireType wire_type) {
    size_t width = 0;

    switch (wire_type) {
    case WireType::VARINT: {
        auto v = decode_varint(buf, offset);
        if (!v.ok()) return Decoded<ByteSpan>::fail(v.status);
        width = v.bytes_consumed;
        break;
    }
    case WireType::FIXED64:
        width = 8;
        break;
    case WireType::FIXED32:
        width = 4;
        break;
    case WireType::LENGTH_DELIMITED:
        return decode_length_delimited(buf, offset);
    default:
        return Decoded<ByteSpan>::fail(DecodeStatus::MALFORMED);
    }

    if (!has_bytes(buf, offset, width)) return Decoded<ByteSpan>::fail(DecodeStatus::TRUNCATED);

    Decoded<ByteSpan> d;
    d.value = buf.subspan(offset, width);
    d.bytes_consumed = width;
    return d;
}

} // namespace pb
