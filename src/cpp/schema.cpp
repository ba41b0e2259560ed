#include "schema.h"

#include <spdlog/spdlog.h>

std::string enum_name(const EnumTable* table, uint64_t value) {
    if (table) {
        for (const auto& e : *table) {
            if (e.value == value) return e.name;
        }
    }
    return std::to_string(value);
}

static bool is_integer_typed(const pb::DecodedValue* v) {
    return v && v->wire_type != pb::WireType::LENGTH_DELIMITED;
}

static std::string format_double(double d) {
    return field_to_string(FieldValue{d});
}

static std::string nested_string(BuildContext& ctx, const pb::ByteSpan& msg,
                                 FieldNode& node, uint32_t field_number) {
    return ctx.descend(msg, node, [&](const pb::ByteSpan& m, FieldNode&) {
        auto inner = pb::parse_message(m);
        return pb::as_string(inner.fields, field_number);
    });
}

SchemaValues apply_schema(BuildContext& ctx, const pb::FieldTable& table,
                          const MessageSchema& schema, FieldNode& node) {
    SchemaValues values;

    for (const auto& rule : schema) {
        const uint32_t fn = rule.field_number;
        const pb::DecodedValue* first = pb::first_value(table, fn);

        switch (rule.kind) {
        case DecodeAs::STRING: {
            std::string s = pb::as_string(table, fn);
            if (!s.empty()) {
                node.add(*rule.info, s);
                values[fn] = s;
            }
            break;
        }
        case DecodeAs::STRING_ALWAYS: {
            std::string s = pb::as_string(table, fn);
            node.add(*rule.info, s);
            values[fn] = s;
            break;
        }
        case DecodeAs::UINT:
            if (is_integer_typed(first)) {
                uint64_t v = pb::as_uint64(table, fn);
                node.add(*rule.info, v);
                values[fn] = std::to_string(v);
            }
            break;
        case DecodeAs::UINT_OR_DEFAULT: {
            uint64_t v = is_integer_typed(first) ? pb::as_uint64(table, fn) : rule.default_uint;
            node.add(*rule.info, v);
            values[fn] = std::to_string(v);
            break;
        }
        case DecodeAs::UINT64_TEXT: {
            uint64_t v = is_integer_typed(first) ? pb::as_uint64(table, fn) : 0;
            if (v != 0) {
                node.add(*rule.info, std::to_string(v));
                values[fn] = std::to_string(v);
            }
            break;
        }
        case DecodeAs::DOUBLE: {
            double d = pb::as_double(table, fn, pb::DoubleEncoding::RAW, 0.0);
            node.add(*rule.info, d);
            values[fn] = format_double(d);
            break;
        }
        case DecodeAs::LAST_FIXED64: {
            double d = pb::last_fixed64_double(table, fn).value_or(0.0);
            node.add(*rule.info, d);
            values[fn] = format_double(d);
            break;
        }
        case DecodeAs::WRAPPED_DOUBLE:
            if (auto d = pb::find_double(table, fn, pb::DoubleEncoding::WRAPPER)) {
                node.add(*rule.info, *d);
                values[fn] = format_double(*d);
            }
            break;
        case DecodeAs::WRAPPED_UINT:
            if (auto v = pb::find_wrapped_uint(table, fn)) {
                node.add(*rule.info, *v);
                values[fn] = std::to_string(*v);
            }
            break;
        case DecodeAs::ENUM:
            if (is_integer_typed(first)) {
                std::string name = enum_name(rule.enums, pb::as_uint64(table, fn));
                node.add(*rule.info, name);
                values[fn] = name;
            }
            break;
        case DecodeAs::NESTED_STRING:
            if (auto msg = pb::as_message(table, fn)) {
                std::string s = nested_string(ctx, *msg, node, rule.nested_field);
                if (!s.empty()) {
                    node.add(*rule.info, s);
                    values[fn] = s;
                }
            }
            break;
        case DecodeAs::MESSAGE:
            if (auto msg = pb::as_message(table, fn)) {
                values[fn] = ctx.descend(rule.builder, *msg, node);
            }
            break;
        case DecodeAs::REPEATED_MESSAGE: {
            auto msgs = pb::all_messages(table, fn);
            for (size_t i = 0; i < msgs.size(); ++i) {
                std::string s = ctx.descend(rule.builder, msgs[i], node);
                if (i == 0) values[fn] = s;
            }
            break;
        }
        }
    }

    return values;
}

const OneofCase* select_oneof(const pb::FieldTable& table, const OneofTable& cases) {
    for (const auto& [field_number, entry] : table) {
        if (entry.values.empty()) continue;
        for (const auto& c : cases) {
            if (c.field_number == field_number) return &c;
        }
    }
    return nullptr;
}

void BuildContext::report_depth_limit() {
    if (depth_reported_) return;
    depth_reported_ = true;
    spdlog::debug("nesting depth limit {} reached, not descending further", max_depth_);
    out_.add_expert(malformed_, "Nesting depth limit reached");
}
