#include "omni_builders.h"
#include "field_registry.h"

#include <spdlog/fmt/fmt.h>

namespace omni {

namespace {

// ── Enum tables ──

const EnumTable SENSOR_STATUS = {
    {0, "NO_STATEMENT"}, {1, "OPERATIONAL"}, {2, "DEGRADED"}, {3, "INOPERATIVE"},
};

const EnumTable ENVIRONMENT = {
    {0, "NO_STATEMENT"}, {1, "SURFACE"}, {2, "SUBSURFACE"}, {3, "AIR"},
    {4, "SPACE"}, {5, "LAND_UNIT"}, {6, "LAND_INSTALLATION"},
};

const EnumTable IDENTITY = {
    {0, "NO_STATEMENT_IA"}, {1, "PENDING"}, {2, "UNKNOWN"}, {3, "ASSUMED_FRIEND"},
    {4, "FRIEND"}, {5, "NEUTRAL"}, {6, "SUSPECT"}, {7, "HOSTILE"},
};

const EnumTable MISSION_TYPE = {
    {0, "NO_STATEMENT"}, {1, "SURVEILLANCE"}, {2, "AIR_COVER"}, {3, "ESCORT"},
    {4, "ATTACK"}, {5, "COMBAT_AIR_PATROL"}, {6, "INTERCEPT"}, {7, "INVESTIGATE"},
    {8, "TRACK"}, {9, "GO_TO"}, {10, "PROVIDE_FIRE_SUPPORT"}, {11, "SEARCH_AND_RESCUE"},
    {12, "TANKER"}, {13, "COMMAND_AND_CONTROL"},
};

const EnumTable PR_TYPE = {
    {0, "NO_STATEMENT"}, {1, "AUTHENTICATE"}, {2, "ACKNOWLEDGE"}, {3, "REQUEST"},
    {4, "INITIATE"}, {5, "TERMINATION"}, {6, "UPDATE"}, {7, "SITUATION_REPORT"},
};

const EnumTable ALERT_CATEGORY = {
    {0, "UNKNOWN"}, {1, "CAT_1 (Critical)"}, {2, "CAT_2 (Major)"},
    {3, "CAT_3 (Routine)"}, {4, "CAT_4 (Syntax Error)"},
};

const EnumTable ALERT_STATE = {
    {0, "CLOSED"}, {1, "AWAITING_RESPONSE"}, {2, "ACTIVE"}, {3, "TIMED_OUT"},
    {4, "INVALID_RESPONSE"},
};

const EnumTable ALERT_TYPE = {
    {0, "NO_STATEMENT"}, {1, "OTHER"}, {2, "BAILOUT"}, {3, "MISSION"},
    {4, "SYSTEM_RESOURCE"}, {5, "EMERGENCY_ACTIVATION"}, {6, "EMERGENCY_DEACTIVATION"},
    {7, "DIFFERENCE_REPORT"}, {8, "INVALID_PARAMETER"}, {9, "THREAT"},
    {10, "HANDOVER"}, {11, "GO_TO_VOICE"}, {12, "CORRELATION"},
};

// Variant names of nested oneofs. No builders: presence alone is rendered.
const OneofTable SHAPE_CASES = {
    {1, "SinglePoint"}, {2, "Ellipse"}, {3, "Rectangle"}, {4, "Polyline"},
    {5, "Polygon"}, {6, "PolyArc"}, {7, "RadArc"},
};

const OneofTable ENTITY_MGMT_CASES = {
    {1, "Drop"}, {2, "Link"}, {3, "Unlink"}, {4, "AliasUpdate"},
};

// ── Common sub-messages ──

const MessageSchema ALIAS_SCHEMA = {
    {1, DecodeAs::STRING, &hf::alias_domain},
    {2, DecodeAs::STRING, &hf::alias_field},
    {3, DecodeAs::STRING, &hf::alias_network},
    {4, DecodeAs::STRING, &hf::alias_id},
};

const MessageSchema ORIGIN_SCHEMA = {
    {1, DecodeAs::STRING, &hf::source_uid},
    {2, DecodeAs::STRING, &hf::source_net},
};

// google.protobuf.Timestamp
const MessageSchema TIMESTAMP_SCHEMA = {
    {1, DecodeAs::UINT, &hf::time_created},
    {2, DecodeAs::UINT, &hf::time_created_nanos},
};

const MessageSchema GEOPOINT_SCHEMA = {
    {1, DecodeAs::DOUBLE,         &hf::geopoint_lat},
    {2, DecodeAs::DOUBLE,         &hf::geopoint_lon},
    {3, DecodeAs::WRAPPED_DOUBLE, &hf::geopoint_hae},
    {4, DecodeAs::WRAPPED_DOUBLE, &hf::geopoint_ce},
    {5, DecodeAs::WRAPPED_DOUBLE, &hf::geopoint_le},
    {6, DecodeAs::WRAPPED_DOUBLE, &hf::geopoint_course},
    {7, DecodeAs::WRAPPED_DOUBLE, &hf::geopoint_speed},
};

std::string build_alias(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::alias, msg);
    auto values = apply_schema(ctx, parsed.fields, ALIAS_SCHEMA, node);
    node.append_text(fmt::format(": {}", values[4]));
    return values[4];
}

std::string build_origin(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::origin, msg);
    auto values = apply_schema(ctx, parsed.fields, ORIGIN_SCHEMA, node);
    node.append_text(fmt::format(": {}", values[1]));
    return values[1];
}

// Adds seconds / nanos directly under the TimeOfValidity node.
std::string build_timestamp(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    auto values = apply_schema(ctx, parsed.fields, TIMESTAMP_SCHEMA, parent);
    return values[1];
}

const MessageSchema TIME_SCHEMA = {
    {1, DecodeAs::MESSAGE, &hf::time_created, nullptr, build_timestamp},
    {2, DecodeAs::UINT,    &hf::time_updated},
    {3, DecodeAs::UINT,    &hf::time_timeout},
};

std::string build_time(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::time, msg);
    auto values = apply_schema(ctx, parsed.fields, TIME_SCHEMA, node);
    return values[1];
}

// ── Event bodies ──

const MessageSchema TRACK_SCHEMA = {
    {1, DecodeAs::MESSAGE, &hf::geopoint, nullptr, build_geopoint},
};

const MessageSchema PLAYER_SCHEMA = {
    // CommunicationParameters.callsign
    {1, DecodeAs::NESTED_STRING, &hf::player_callsign, nullptr, nullptr, 0, 1},
};

const MessageSchema SENSOR_SCHEMA = {
    {2, DecodeAs::MESSAGE, &hf::geopoint,      nullptr, build_geopoint},
    {3, DecodeAs::ENUM,    &hf::sensor_status, &SENSOR_STATUS},
};

const MessageSchema SHAPE_SCHEMA = {
    {8, DecodeAs::ENUM, &hf::shape_environment, &ENVIRONMENT},
    {9, DecodeAs::ENUM, &hf::shape_identity,    &IDENTITY},
};

const MessageSchema CHAT_SCHEMA = {
    {1, DecodeAs::STRING,        &hf::chat_message},
    // source Alias.id
    {3, DecodeAs::NESTED_STRING, &hf::chat_sender, nullptr, nullptr, 0, 4},
};

const MessageSchema MISSION_SCHEMA = {
    {1, DecodeAs::ENUM,          &hf::mission_type,      &MISSION_TYPE},
    {2, DecodeAs::NESTED_STRING, &hf::mission_source,    nullptr, nullptr, 0, 4},
    {3, DecodeAs::NESTED_STRING, &hf::mission_addressee, nullptr, nullptr, 0, 4},
};

const MessageSchema WEATHER_SCHEMA = {
    {1, DecodeAs::ENUM, &hf::weather_category},
};

const MessageSchema AIRFIELD_SCHEMA = {
    {1, DecodeAs::STRING, &hf::airfield_icao},
    {2, DecodeAs::ENUM,   &hf::airfield_status},
};

const MessageSchema PR_SCHEMA = {
    {1, DecodeAs::ENUM, &hf::pr_type, &PR_TYPE},
    {2, DecodeAs::ENUM, &hf::pr_status},
};

const MessageSchema NETWORK_ERROR_SCHEMA = {
    {2, DecodeAs::STRING, &hf::network_mgmt_message},
};

const MessageSchema NAV_VECTOR_SCHEMA = {
    {1, DecodeAs::WRAPPED_DOUBLE, &hf::nav_course},
    {2, DecodeAs::WRAPPED_DOUBLE, &hf::nav_speed},
    {3, DecodeAs::WRAPPED_DOUBLE, &hf::nav_altitude},
};

const MessageSchema IMAGE_SCHEMA = {
    {2, DecodeAs::MESSAGE, &hf::geopoint, nullptr, build_geopoint},
};

const MessageSchema ALERT_SCHEMA = {
    {1, DecodeAs::STRING, &hf::alert_message},
    {2, DecodeAs::ENUM,   &hf::alert_category, &ALERT_CATEGORY},
    {3, DecodeAs::ENUM,   &hf::alert_state,    &ALERT_STATE},
    {6, DecodeAs::ENUM,   &hf::alert_type,     &ALERT_TYPE},
};

const MessageSchema FLIGHT_PATH_SCHEMA = {
    {1, DecodeAs::WRAPPED_UINT, &hf::flight_path_seq},
    {4, DecodeAs::WRAPPED_UINT, &hf::flight_path_points},
};

// Most event bodies are a schema plus a fixed or first-value summary.
struct EventBody {
    const FieldInfo& node;
    const MessageSchema& schema;
    uint32_t summary_field;       // 0 = always use fallback
    const char* fallback;
};

std::string build_event_body(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent,
                             const EventBody& body) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(body.node, msg);
    auto values = apply_schema(ctx, parsed.fields, body.schema, node);

    std::string summary = body.summary_field ? values[body.summary_field] : "";
    if (summary.empty()) summary = body.fallback;
    node.append_text(fmt::format(": {}", summary));
    return summary;
}

std::string build_other(BuildContext&, const pb::ByteSpan& msg, FieldNode& parent) {
    parent.add(hf::other_event, msg);
    return "Other";
}

std::string build_track(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::track_event, TRACK_SCHEMA, 0, "Track Event"});
}

std::string build_player(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::player, PLAYER_SCHEMA, 1, "Player Event"});
}

std::string build_sensor(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::sensor, SENSOR_SCHEMA, 0, "Sensor Event"});
}

std::string build_shape(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::shape, msg);

    std::string shape_type = "Unknown";
    if (const OneofCase* c = select_oneof(parsed.fields, SHAPE_CASES)) {
        shape_type = c->name;
        node.add(hf::shape_type, shape_type);
    }
    apply_schema(ctx, parsed.fields, SHAPE_SCHEMA, node);

    node.append_text(fmt::format(": {}", shape_type));
    return shape_type;
}

std::string build_chat(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::chat, CHAT_SCHEMA, 1, "Chat"});
}

std::string build_mission(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::mission, MISSION_SCHEMA, 0, "Mission Assignment"});
}

std::string build_weather(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::weather, WEATHER_SCHEMA, 0, "Weather Event"});
}

std::string build_airfield(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::airfield, AIRFIELD_SCHEMA, 1, "Airfield"});
}

std::string build_personnel_recovery(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::pr, PR_SCHEMA, 0, "Personnel Recovery"});
}

std::string build_entity_mgmt(BuildContext&, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::entity_mgmt, msg);

    const OneofCase* c = select_oneof(parsed.fields, ENTITY_MGMT_CASES);
    std::string action = c ? c->name : "Unknown";
    node.add(hf::entity_mgmt_action, action);

    node.append_text(fmt::format(": {}", action));
    return action;
}

// NetworkManagement.Error: the message sits in field 2
std::string build_network_error(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    auto values = apply_schema(ctx, parsed.fields, NETWORK_ERROR_SCHEMA, parent);
    return values[2];
}

const OneofTable NETWORK_MGMT_CASES = {
    {1, "Ping"}, {2, "Terminate"}, {3, "Error", build_network_error}, {4, "ServerDiscovery"},
};

std::string build_network_mgmt(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::network_mgmt, msg);

    std::string mgmt_type = "Unknown";
    if (const OneofCase* c = select_oneof(parsed.fields, NETWORK_MGMT_CASES)) {
        mgmt_type = c->name;
        node.add(hf::network_mgmt_type, mgmt_type);
        if (c->builder) {
            if (auto body = pb::as_message(parsed.fields, c->field_number)) {
                ctx.descend(c->builder, *body, node);
            }
        }
    }

    node.append_text(fmt::format(": {}", mgmt_type));
    return mgmt_type;
}

std::string build_nav_vector(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::nav_vector, NAV_VECTOR_SCHEMA, 0, "Navigation Vector"});
}

std::string build_image(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::image, IMAGE_SCHEMA, 0, "Image Event"});
}

std::string build_alert(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::alert, ALERT_SCHEMA, 1, "Alert"});
}

std::string build_flight_path(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    return build_event_body(ctx, msg, parent, {hf::flight_path, FLIGHT_PATH_SCHEMA, 0, "Flight Path"});
}

const MessageSchema BASE_EVENT_SCHEMA = {
    {1, DecodeAs::UINT64_TEXT,      &hf::entity_id},
    {9, DecodeAs::UINT64_TEXT,      &hf::seq_num},
    {2, DecodeAs::MESSAGE,          &hf::origin, nullptr, build_origin},
    {4, DecodeAs::MESSAGE,          &hf::time,   nullptr, build_time},
    {5, DecodeAs::REPEATED_MESSAGE, &hf::alias,  nullptr, build_alias},
};

} // namespace

std::string build_geopoint(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::geopoint, msg);
    apply_schema(ctx, parsed.fields, GEOPOINT_SCHEMA, node);

    double lat = pb::as_double(parsed.fields, 1, pb::DoubleEncoding::RAW);
    double lon = pb::as_double(parsed.fields, 2, pb::DoubleEncoding::RAW);
    std::string summary = fmt::format("{:.6f}, {:.6f}", lat, lon);
    node.append_text(": " + summary);
    return summary;
}

const OneofTable& event_cases() {
    static const OneofTable cases = {
        {11, "Other",             build_other},
        {12, "Track",             build_track},
        {13, "Player",            build_player},
        {14, "Sensor",            build_sensor},
        {15, "Shape",             build_shape},
        {16, "Chat",              build_chat},
        {17, "MissionAssignment", build_mission},
        {20, "Weather",           build_weather},
        {22, "AirfieldStatus",    build_airfield},
        {23, "PersonnelRecovery", build_personnel_recovery},
        {25, "EntityManagement",  build_entity_mgmt},
        {26, "NetworkManagement", build_network_mgmt},
        {29, "NavigationVector",  build_nav_vector},
        {36, "Image",             build_image},
        {37, "Alert",             build_alert},
        {42, "FlightPath",        build_flight_path},
    };
    return cases;
}

std::string build_base_event(BuildContext& ctx, const pb::ByteSpan& msg, FieldNode& parent) {
    auto parsed = pb::parse_message(msg);
    FieldNode& node = parent.add(hf::base_event, msg);
    apply_schema(ctx, parsed.fields, BASE_EVENT_SCHEMA, node);

    std::string event_type = "Unknown";
    if (const OneofCase* c = select_oneof(parsed.fields, event_cases())) {
        event_type = c->name;
        // A scalar in the oneof slot still names the type; there is nothing to descend into
        if (auto body = pb::as_message(parsed.fields, c->field_number)) {
            ctx.descend(c->builder, *body, node);
        }
    }
    node.add(hf::event_type, event_type);

    uint64_t entity_id = pb::as_uint64(parsed.fields, 1);
    node.append_text(fmt::format(": {} (Entity {})", event_type, entity_id));
    return fmt::format(" [{} #{}]", event_type, entity_id);
}

} // namespace omni
