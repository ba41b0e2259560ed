#include "tak_builders.h"
#include "field_registry.h"

#include <spdlog/fmt/fmt.h>

namespace tak {

namespace {

// ── Detail children ──

const MessageSchema CONTACT_SCHEMA = {
    {1, DecodeAs::STRING, &hf::contact_endpoint},
    {2, DecodeAs::STRING, &hf::contact_callsign},
};

const MessageSchema GROUP_SCHEMA = {
    {1, DecodeAs::STRING, &hf::group_name},
    {2, DecodeAs::STRING, &hf::group_role},
};

const MessageSchema STATUS_SCHEMA = {
    {1, DecodeAs::UINT_OR_DEFAULT, &hf::status_battery},
};

const MessageSchema TAKV_SCHEMA = {
    {1, DecodeAs::STRING, &hf::takv_device},
    {2, DecodeAs::STRING, &hf::takv_platform},
    {3, DecodeAs::STRING, &hf::takv_os},
    {4, DecodeAs::STRING, &hf::takv_version},
};

const MessageSchema TRACK_SCHEMA = {
    {1, DecodeAs::DOUBLE, &hf::track_speed},
    {2, DecodeAs::DOUBLE, &hf::track_course},
};

const MessageSchema PRECISION_SCHEMA = {
    {1, DecodeAs::STRING, &hf::precision_geopointsrc},
    {2, DecodeAs::STRING, &hf::precision_altsrc},
};

std::string build_contact(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::contact, msg);
    auto values = apply_schema(ctx, parsed.fields, CONTACT_SCHEMA, node);
    node.append_text(fmt::format(": {}", values[2]));
    return values[2];
}

std::string build_group(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::group, msg);
    auto values = apply_schema(ctx, parsed.fields, GROUP_SCHEMA, node);
    node.append_text(fmt::format(": {} ({})", values[1], values[2]));
    return values[1];
}

std::string build_status(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::status, msg);
    auto values = apply_schema(ctx, parsed.fields, STATUS_SCHEMA, node);
    node.append_text(fmt::format(": Battery {}%", values[1]));
    return values[1];
}

std::string build_takv(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::takv, msg);
    auto values = apply_schema(ctx, parsed.fields, TAKV_SCHEMA, node);
    node.append_text(fmt::format(": {} {}", values[2], values[4]));
    return values[2];
}

std::string build_track(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::track, msg);
    apply_schema(ctx, parsed.fields, TRACK_SCHEMA, node);

    double speed = pb::as_double(parsed.fields, 1, pb::DoubleEncoding::RAW);
    double course = pb::as_double(parsed.fields, 2, pb::DoubleEncoding::RAW);
    std::string summary = fmt::format("Speed {:.1f}, Course {:.1f}", speed, course);
    node.append_text(": " + summary);
    return summary;
}

std::string build_precision(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::precision, msg);
    auto values = apply_schema(ctx, parsed.fields, PRECISION_SCHEMA, node);
    return values[1];
}

const MessageSchema DETAIL_SCHEMA = {
    {1, DecodeAs::STRING,  &hf::xml_detail},
    {2, DecodeAs::MESSAGE, &hf::contact,   nullptr, build_contact},
    {3, DecodeAs::MESSAGE, &hf::group,     nullptr, build_group},
    {4, DecodeAs::MESSAGE, &hf::precision, nullptr, build_precision},
    {5, DecodeAs::MESSAGE, &hf::status,    nullptr, build_status},
    {6, DecodeAs::MESSAGE, &hf::takv,      nullptr, build_takv},
    {7, DecodeAs::MESSAGE, &hf::track,     nullptr, build_track},
};

std::string build_detail(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::detail, msg);
    auto values = apply_schema(ctx, parsed.fields, DETAIL_SCHEMA, node);
    return values[1];
}

// ── Control / event core ──

const MessageSchema CONTROL_SCHEMA = {
    {1, DecodeAs::UINT_OR_DEFAULT, &hf::tak_min_proto, nullptr, nullptr, 1},
    {2, DecodeAs::UINT_OR_DEFAULT, &hf::tak_max_proto, nullptr, nullptr, 1},
    {3, DecodeAs::STRING,          &hf::tak_contact_uid},
};

// Display order, not field-number order.
const MessageSchema COT_SCHEMA = {
    {1, DecodeAs::STRING_ALWAYS, &hf::cot_type},
    {5, DecodeAs::STRING_ALWAYS, &hf::cot_uid},
    {9, DecodeAs::STRING,        &hf::cot_how},
    {2, DecodeAs::STRING,        &hf::cot_access},
    {3, DecodeAs::STRING,        &hf::cot_qos},
    {4, DecodeAs::STRING,        &hf::cot_opex},
    {6, DecodeAs::UINT,          &hf::cot_time},
    {7, DecodeAs::UINT,          &hf::cot_start},
    {8, DecodeAs::UINT,          &hf::cot_stale},
};

const MessageSchema POINT_SCHEMA = {
    {10, DecodeAs::LAST_FIXED64, &hf::point_lat},
    {11, DecodeAs::LAST_FIXED64, &hf::point_lon},
    {12, DecodeAs::LAST_FIXED64, &hf::point_hae},
    {13, DecodeAs::LAST_FIXED64, &hf::point_ce},
    {14, DecodeAs::LAST_FIXED64, &hf::point_le},
};

const MessageSchema COT_DETAIL_SCHEMA = {
    {15, DecodeAs::MESSAGE, &hf::detail, nullptr, build_detail},
};

} // namespace

std::string build_tak_control(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::tak_control, msg);
    auto values = apply_schema(ctx, parsed.fields, CONTROL_SCHEMA, node);
    node.append_text(fmt::format(" (v{}-{})", values[1], values[2]));
    return values[3];
}

CotSummary build_cot_event(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::cot_event, msg);
    auto values = apply_schema(ctx, parsed.fields, COT_SCHEMA, node);

    // Point has no message of its own on the wire: it groups fields 10-14.
    // A repeated coordinate takes its last FIXED64 occurrence.
    FieldNode& point = node.add(hf::point);
    apply_schema(ctx, parsed.fields, POINT_SCHEMA, point);
    double lat = pb::last_fixed64_double(parsed.fields, 10).value_or(0.0);
    double lon = pb::last_fixed64_double(parsed.fields, 11).value_or(0.0);
    point.append_text(fmt::format(": {:.6f}, {:.6f}", lat, lon));

    apply_schema(ctx, parsed.fields, COT_DETAIL_SCHEMA, node);

    CotSummary summary{values[5], values[1]};
    node.append_text(fmt::format(": {} ({})", summary.type, summary.uid));
    return summary;
}

std::string build_tak_message(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);

    std::string uid;
    std::string cot_type;

    if (auto control = pb::as_message(parsed.fields, 1)) {
        uid = ctx.descend(build_tak_control, *control, parent);
    }

    if (auto event = pb::as_message(parsed.fields, 2)) {
        CotSummary cot = ctx.descend(*event, parent,
            [&ctx](const pb::ByteSpan& m, FieldNode& p) { return build_cot_event(ctx, m, p); });
        uid = cot.uid;
        cot_type = cot.type;
    }

    std::string info;
    if (!uid.empty()) info += fmt::format(" [{}]", uid);
    if (!cot_type.empty()) info += fmt::format(" {}", cot_type);
    return info;
}

} // namespace tak
