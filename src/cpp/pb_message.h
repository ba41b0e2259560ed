#pragma once

#include "pb_wire.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema-free protobuf message walker and typed accessors.
// A FieldTable maps field number -> every value seen for it, in wire order.

namespace pb {

// One decoded value. VARINT carries the integer; every other wire type
// carries the raw bytes (8 for FIXED64, 4 for FIXED32, payload for
// LENGTH_DELIMITED), borrowed from the caller's buffer.
struct DecodedValue {
    WireType wire_type = WireType::VARINT;
    std::variant<uint64_t, ByteSpan> data;

    bool is_integer() const { return std::holds_alternative<uint64_t>(data); }
    uint64_t integer() const;      // 0 unless VARINT
    ByteSpan bytes() const;        // empty unless a span-carrying wire type
};

struct FieldEntry {
    WireType wire_type = WireType::VARINT;   // wire type of the first occurrence
    std::vector<DecodedValue> values;
};

// Ordered by field number, so iteration is deterministic.
using FieldTable = std::map<uint32_t, FieldEntry>;

// Best-effort parse result. A malformed or truncated field stops the walk;
// everything before it is kept and bytes_consumed covers only that prefix.
struct ParsedMessage {
    FieldTable fields;
    size_t bytes_consumed = 0;
    DecodeStatus stop_status = DecodeStatus::OK;

    bool complete() const { return stop_status == DecodeStatus::OK; }
};

// Walk buf[offset, offset+length). Never reads outside that window and
// never throws on bad input.
ParsedMessage parse_message(const ByteSpan& buf, size_t offset, size_t length);

inline ParsedMessage parse_message(const ByteSpan& msg) {
    return parse_message(msg, 0, msg.size());
}

// ── Field accessors ──

// How a double-typed field travels on the wire for a given schema.
//   RAW     : FIXED64 (or an 8-byte length-delimited payload)
//   WRAPPER : google.protobuf.DoubleValue, i.e. an embedded message whose
//             field 1 holds the double
// Both shapes are accepted either way. An 8-byte length-delimited payload is
// always the raw double; a wrapper's field 1 must be FIXED64.
enum class DoubleEncoding { RAW, WRAPPER };

bool has_field(const FieldTable& table, uint32_t field_number);

const DecodedValue* first_value(const FieldTable& table, uint32_t field_number);
DecodedValue first_value(const FieldTable& table, uint32_t field_number,
                         const DecodedValue& default_value);

// LENGTH_DELIMITED bytes as text; integer-typed values yield the default.
std::string as_string(const FieldTable& table, uint32_t field_number,
                      const std::string& default_value = "");

// Full 64-bit integer. VARINT passes through; FIXED64/FIXED32 are read
// little-endian. Length-delimited values yield the default.
uint64_t as_uint64(const FieldTable& table, uint32_t field_number,
                   uint64_t default_value = 0);

std::optional<double> find_double(const FieldTable& table, uint32_t field_number,
                                  DoubleEncoding encoding);
double as_double(const FieldTable& table, uint32_t field_number,
                 DoubleEncoding encoding, double default_value = 0.0);

// Last FIXED64 occurrence; other wire types are skipped.
std::optional<double> last_fixed64_double(const FieldTable& table, uint32_t field_number);

// Single wrapped integer (google.protobuf.UInt32Value / UInt64Value).
std::optional<uint64_t> find_wrapped_uint(const FieldTable& table, uint32_t field_number);

// Payload of the first / every LENGTH_DELIMITED occurrence.
std::optional<ByteSpan> as_message(const FieldTable& table, uint32_t field_number);
std::vector<ByteSpan> all_messages(const FieldTable& table, uint32_t field_number);

std::optional<double> value_as_double(const DecodedValue& v, DoubleEncoding encoding);

} // namespace pb
