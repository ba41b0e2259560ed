#pragma once

#include "field_tree.h"
#include "pb_message.h"
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// ── Schema-by-convention ──
// Field numbers and their meaning are compiled in. Each known message type is
// a table of FieldRule rows; apply_schema() walks the table against a parsed
// FieldTable and emits tree nodes. Adding a field is a table edit.

class BuildContext;

// A nested-message builder: renders msg under parent and returns a short
// summary (callsign, identifier, event-type name ...) for the caller.
using MessageBuilder = std::string (*)(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent);

enum class DecodeAs {
    STRING,           // text, added when non-empty
    STRING_ALWAYS,    // text, added even when empty
    UINT,             // integer, added when present and integer-typed
    UINT_OR_DEFAULT,  // integer, always added (default_uint when absent)
    UINT64_TEXT,      // full 64-bit integer rendered as decimal text, added when non-zero
    DOUBLE,           // RAW-convention double, always added (0.0 when absent)
    LAST_FIXED64,     // last FIXED64 occurrence as a double, always added (0.0 when absent)
    WRAPPED_DOUBLE,   // DoubleValue wrapper, added when present
    WRAPPED_UINT,     // UInt32Value / UInt64Value wrapper, added when present
    ENUM,             // varint through an EnumTable; unknown values render as the number
    NESTED_STRING,    // embedded message, string field nested_field of it, added when non-empty
    MESSAGE,          // embedded message handed to builder (first occurrence)
    REPEATED_MESSAGE, // every occurrence handed to builder
};

struct EnumValue {
    uint64_t value;
    const char* name;
};
using EnumTable = std::vector<EnumValue>;

std::string enum_name(const EnumTable* table, uint64_t value);

struct FieldRule {
    uint32_t field_number;
    DecodeAs kind;
    const FieldInfo* info = nullptr;
    const EnumTable* enums = nullptr;
    MessageBuilder builder = nullptr;
    uint64_t default_uint = 0;
    uint32_t nested_field = 0;
};

using MessageSchema = std::vector<FieldRule>;

// Rendered text of each rule that emitted something, keyed by field number.
// MESSAGE / REPEATED_MESSAGE rules record the (first) builder summary.
using SchemaValues = std::map<uint32_t, std::string>;

SchemaValues apply_schema(BuildContext& ctx, const pb::FieldTable& table,
                          const MessageSchema& schema, FieldNode& node);

// ── Oneof dispatch ──
// The first alternative present wins, scanning the message's fields in
// ascending field-number order. Well-formed input carries at most one.
struct OneofCase {
    uint32_t field_number;
    const char* name;
    MessageBuilder builder = nullptr;
};
using OneofTable = std::vector<OneofCase>;

const OneofCase* select_oneof(const pb::FieldTable& table, const OneofTable& cases);

// ── Build context ──
// Carries the output sink and the nesting budget through one dissect call.
// Never shared between calls.
class BuildContext {
public:
    BuildContext(DissectOutput& out, const ExpertDef& malformed, size_t max_depth)
        : out_(out), malformed_(malformed), max_depth_(max_depth) {}

    DissectOutput& output() { return out_; }
    size_t depth() const { return depth_; }
    size_t max_depth() const { return max_depth_; }

    // Run fn(msg, parent) one nesting level deeper. When the depth limit is
    // reached fn is not called, one expert info is raised, and a
    // default-constructed result is returned.
    template <typename Fn>
    auto descend(const pb::ByteSpan& msg, FieldNode& parent, Fn&& fn)
        -> std::decay_t<decltype(fn(msg, parent))>
    {
        using Result = std::decay_t<decltype(fn(msg, parent))>;
        if (depth_ >= max_depth_) {
            report_depth_limit();
            return Result{};
        }
        ++depth_;
        Result r = fn(msg, parent);
        --depth_;
        return r;
    }

    std::string descend(MessageBuilder builder, const pb::ByteSpan& msg, FieldNode& parent) {
        return descend(msg, parent, [&](const pb::ByteSpan& m, FieldNode& p) {
            return builder(*this, m, p);
        });
    }

private:
    void report_depth_limit();

    DissectOutput& out_;
    const ExpertDef& malformed_;
    size_t max_depth_;
    size_t depth_ = 0;
    bool depth_reported_ = false;
};
