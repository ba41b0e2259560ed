#include "pb_message.h"
#include "util.h"

#include <spdlog/spdlog.h>

namespace pb {

uint64_t DecodedValue::integer() const {
    if (auto* p = std::get_if<uint64_t>(&data)) return *p;
    return 0;
}

ByteSpan DecodedValue::bytes() const {
    if (auto* p = std::get_if<ByteSpan>(&data)) return *p;
    return {};
}

// ── Dynamic message parser ──

ParsedMessage parse_message(const ByteSpan& buf, size_t offset, size_t length) {
    ParsedMessage result;
    ByteSpan window = buf.subspan(offset, length);
    size_t pos = 0;

    while (pos < window.size()) {
        auto tag = decode_tag(window, pos);
        if (!tag.ok()) {
            result.stop_status = tag.status;
            break;
        }

        size_t value_pos = pos + tag.bytes_consumed;
        DecodedValue value;
        value.wire_type = tag.value.wire_type;
        size_t value_len = 0;

        if (tag.value.wire_type == WireType::VARINT) {
            auto v = decode_varint(window, value_pos);
            if (!v.ok()) {
                result.stop_status = v.status;
                break;
            }
            value.data = v.value;
            value_len = v.bytes_consumed;
        } else {
            auto v = skip_value(window, value_pos, tag.value.wire_type);
            if (!v.ok()) {
                result.stop_status = v.status;
                break;
            }
            value.data = v.value;
            value_len = v.bytes_consumed;
        }

        if (value_len == 0) {
            result.stop_status = DecodeStatus::MALFORMED;
            break;
        }

        auto& entry = result.fields[tag.value.field_number];
        if (entry.values.empty()) entry.wire_type = tag.value.wire_type;
        entry.values.push_back(std::move(value));

        pos = value_pos + value_len;
    }

    result.bytes_consumed = pos;

    if (!result.complete()) {
        spdlog::trace("protobuf walk stopped at +{} of {} ({}), kept {} field(s)",
                      pos, window.size(), status_name(result.stop_status),
                      result.fields.size());
    }
    return result;
}

// ── Field accessors ──

bool has_field(const FieldTable& table, uint32_t field_number) {
    auto it = table.find(field_number);
    return it != table.end() && !it->second.values.empty();
}

const DecodedValue* first_value(const FieldTable& table, uint32_t field_number) {
    auto it = table.find(field_number);
    if (it == table.end() || it->second.values.empty()) return nullptr;
    return &it->second.values.front();
}

DecodedValue first_value(const FieldTable& table, uint32_t field_number,
                         const DecodedValue& default_value) {
    auto* v = first_value(table, field_number);
    return v ? *v : default_value;
}

std::string as_string(const FieldTable& table, uint32_t field_number,
                      const std::string& default_value) {
    auto* v = first_value(table, field_number);
    if (!v || v->wire_type != WireType::LENGTH_DELIMITED) return default_value;
    return v->bytes().to_string();
}

uint64_t as_uint64(const FieldTable& table, uint32_t field_number, uint64_t default_value) {
    auto* v = first_value(table, field_number);
    if (!v) return default_value;

    switch (v->wire_type) {
    case WireType::VARINT:
        return v->integer();
    case WireType::FIXED64:
        return util::read_u64_le(v->bytes().data());
    case WireType::FIXED32:
        return util::read_u32_le(v->bytes().data());
    default:
        return default_value;
    }
}

static std::optional<double> unwrap_double(const ByteSpan& payload) {
    // proto3 omits a zero value, leaving an empty wrapper
    if (payload.empty()) return 0.0;
    auto inner = parse_message(payload);
    auto* v = first_value(inner.fields, 1);
    if (!v) return std::nullopt;
    // DoubleValue.value is always fixed64
    if (v->wire_type == WireType::FIXED64) return util::read_f64_le(v->bytes().data());
    return std::nullopt;
}

std::optional<double> value_as_double(const DecodedValue& v, DoubleEncoding encoding) {
    switch (v.wire_type) {
    case WireType::FIXED64:
        return util::read_f64_le(v.bytes().data());
    case WireType::FIXED32:
        return static_cast<double>(util::read_f32_le(v.bytes().data()));
    case WireType::LENGTH_DELIMITED: {
        // A DoubleValue is 0 or 9 bytes, never 8, so an 8-byte payload is
        // the raw double under either convention.
        ByteSpan payload = v.bytes();
        if (payload.size() == 8) return util::read_f64_le(payload.data());
        return unwrap_double(payload);
    }
    default:
        return std::nullopt;
    }
}

std::optional<double> last_fixed64_double(const FieldTable& table, uint32_t field_number) {
    auto it = table.find(field_number);
    if (it == table.end()) return std::nullopt;
    std::optional<double> last;
    for (const auto& v : it->second.values) {
        if (v.wire_type == WireType::FIXED64) last = util::read_f64_le(v.bytes().data());
    }
    return last;
}

std::optional<double> find_double(const FieldTable& table, uint32_t field_number,
                                  DoubleEncoding encoding) {
    auto* v = first_value(table, field_number);
    if (!v) return std::nullopt;
    return value_as_double(*v, encoding);
}

double as_double(const FieldTable& table, uint32_t field_number,
                 DoubleEncoding encoding, double default_value) {
    auto d = find_double(table, field_number, encoding);
    return d ? *d : default_value;
}

std::optional<uint64_t> find_wrapped_uint(const FieldTable& table, uint32_t field_number) {
    auto* v = first_value(table, field_number);
    if (!v) return std::nullopt;
    if (v->wire_type == WireType::VARINT) return v->integer();
    if (v->wire_type != WireType::LENGTH_DELIMITED) return std::nullopt;

    auto inner = parse_message(v->bytes());
    auto* iv = first_value(inner.fields, 1);
    if (!iv || iv->wire_type != WireType::VARINT) {
        // An empty wrapper is the proto3 default value
        if (inner.fields.empty() && inner.complete()) return uint64_t{0};
        return std::nullopt;
    }
    return iv->integer();
}

std::optional<ByteSpan> as_message(const FieldTable& table, uint32_t field_number) {
    auto* v = first_value(table, field_number);
    if (!v || v->wire_type != WireType::LENGTH_DELIMITED) return std::nullopt;
    return v->bytes();
}

std::vector<ByteSpan> all_messages(const FieldTable& table, uint32_t field_number) {
    std::vector<ByteSpan> out;
    auto it = table.find(field_number);
    if (it == table.end()) return out;
    for (const auto& v : it->second.values) {
        if (v.wire_type == WireType::LENGTH_DELIMITED) out.push_back(v.bytes());
    }
    return out;
}

} // namespace pb
