#pragma once

#include "field_tree.h"
#include <vector>

// ── Field registry (X-Macro) ──
// Single source of truth for every field the dissectors emit.
// Adding a field = add one line here, then reference hf::<ident> in a schema.
//
// X(ident, abbrev, display_name, FieldType)

#define TAK_FIELDS(X) \
    X(tak,                      "tak",                            "TAK Protocol",                 NONE)   \
    X(tak_protocol,             "tak.protocol",                   "Protocol",                     STRING) \
    X(tak_version,              "tak.version",                    "Version",                      UINT8)  \
    X(tak_length,               "tak.length",                     "Length",                       UINT32) \
    X(tak_control,              "tak.control",                    "TAK Control",                  NONE)   \
    X(tak_min_proto,            "tak.control.min_proto",          "Min Protocol Version",         UINT32) \
    X(tak_max_proto,            "tak.control.max_proto",          "Max Protocol Version",         UINT32) \
    X(tak_contact_uid,          "tak.control.contact_uid",        "Contact UID",                  STRING) \
    X(cot_event,                "tak.cot",                        "CoT Event",                    NONE)   \
    X(cot_type,                 "tak.cot.type",                   "Type",                         STRING) \
    X(cot_uid,                  "tak.cot.uid",                    "UID",                          STRING) \
    X(cot_how,                  "tak.cot.how",                    "How",                          STRING) \
    X(cot_time,                 "tak.cot.time",                   "Send Time",                    UINT64) \
    X(cot_start,                "tak.cot.start",                  "Start Time",                   UINT64) \
    X(cot_stale,                "tak.cot.stale",                  "Stale Time",                   UINT64) \
    X(cot_access,               "tak.cot.access",                 "Access",                       STRING) \
    X(cot_qos,                  "tak.cot.qos",                    "QoS",                          STRING) \
    X(cot_opex,                 "tak.cot.opex",                   "Opex",                         STRING) \
    X(point,                    "tak.point",                      "Point",                        NONE)   \
    X(point_lat,                "tak.point.lat",                  "Latitude",                     DOUBLE) \
    X(point_lon,                "tak.point.lon",                  "Longitude",                    DOUBLE) \
    X(point_hae,                "tak.point.hae",                  "HAE (Height Above Ellipsoid)", DOUBLE) \
    X(point_ce,                 "tak.point.ce",                   "CE (Circular Error)",          DOUBLE) \
    X(point_le,                 "tak.point.le",                   "LE (Linear Error)",            DOUBLE) \
    X(detail,                   "tak.detail",                     "Detail",                       NONE)   \
    X(xml_detail,               "tak.detail.xml",                 "XML Detail",                   STRING) \
    X(contact,                  "tak.detail.contact",             "Contact",                      NONE)   \
    X(contact_callsign,         "tak.detail.contact.callsign",    "Callsign",                     STRING) \
    X(contact_endpoint,         "tak.detail.contact.endpoint",    "Endpoint",                     STRING) \
    X(group,                    "tak.detail.group",               "Group",                        NONE)   \
    X(group_name,               "tak.detail.group.name",          "Name",                         STRING) \
    X(group_role,               "tak.detail.group.role",          "Role",                         STRING) \
    X(status,                   "tak.detail.status",              "Status",                       NONE)   \
    X(status_battery,           "tak.detail.status.battery",      "Battery",                      UINT32) \
    X(takv,                     "tak.detail.takv",                "TAK Version",                  NONE)   \
    X(takv_device,              "tak.detail.takv.device",         "Device",                       STRING) \
    X(takv_platform,            "tak.detail.takv.platform",       "Platform",                     STRING) \
    X(takv_os,                  "tak.detail.takv.os",             "OS",                           STRING) \
    X(takv_version,             "tak.detail.takv.version",        "Version",                      STRING) \
    X(track,                    "tak.detail.track",               "Track",                        NONE)   \
    X(track_speed,              "tak.detail.track.speed",         "Speed",                        DOUBLE) \
    X(track_course,             "tak.detail.track.course",        "Course",                       DOUBLE) \
    X(precision,                "tak.detail.precision",           "Precision Location",           NONE)   \
    X(precision_geopointsrc,    "tak.detail.precision.geopointsrc", "Geopoint Source",            STRING) \
    X(precision_altsrc,         "tak.detail.precision.altsrc",    "Altitude Source",              STRING)

#define OMNI_FIELDS(X) \
    X(omni,                     "omni",                           "OMNI Protocol",                NONE)   \
    X(omni_protocol,            "omni.protocol",                  "Protocol",                     STRING) \
    X(omni_version,             "omni.version",                   "Version",                      UINT8)  \
    X(omni_length,              "omni.length",                    "Length",                       UINT32) \
    X(base_event,               "omni.event",                     "OMNI Event",                   NONE)   \
    X(entity_id,                "omni.entity_id",                 "Entity ID",                    STRING) \
    X(seq_num,                  "omni.seq_num",                   "Sequence Number",              STRING) \
    X(event_type,               "omni.event_type",                "Event Type",                   STRING) \
    X(origin,                   "omni.origin",                    "Origin",                       NONE)   \
    X(source_uid,               "omni.origin.source_uid",         "Source UID",                   STRING) \
    X(source_net,               "omni.origin.source_net",         "Source Network",               STRING) \
    X(time,                     "omni.time",                      "Time of Validity",             NONE)   \
    X(time_created,             "omni.time.created",              "Created",                      UINT64) \
    X(time_created_nanos,       "omni.time.created_nanos",        "Created (ns)",                 UINT32) \
    X(time_updated,             "omni.time.updated",              "Updated (ms)",                 UINT32) \
    X(time_timeout,             "omni.time.timeout",              "Timeout (ms)",                 UINT32) \
    X(alias,                    "omni.alias",                     "Alias",                        NONE)   \
    X(alias_domain,             "omni.alias.domain",              "Domain",                       STRING) \
    X(alias_field,              "omni.alias.field",               "Field",                        STRING) \
    X(alias_network,            "omni.alias.network",             "Network",                      STRING) \
    X(alias_id,                 "omni.alias.id",                  "ID",                           STRING) \
    X(other_event,              "omni.other",                     "Other Event",                  NONE)   \
    X(track_event,              "omni.track",                     "Track Event",                  NONE)   \
    X(player,                   "omni.player",                    "Player Event",                 NONE)   \
    X(player_callsign,          "omni.player.callsign",           "Callsign",                     STRING) \
    X(chat,                     "omni.chat",                      "Chat Event",                   NONE)   \
    X(chat_sender,              "omni.chat.sender",               "Sender",                       STRING) \
    X(chat_message,             "omni.chat.message",              "Message",                      STRING) \
    X(sensor,                   "omni.sensor",                    "Sensor Event",                 NONE)   \
    X(sensor_status,            "omni.sensor.status",             "Status",                       STRING) \
    X(shape,                    "omni.shape",                     "Shape Event",                  NONE)   \
    X(shape_type,               "omni.shape.type",                "Shape Type",                   STRING) \
    X(shape_environment,        "omni.shape.environment",         "Environment",                  STRING) \
    X(shape_identity,           "omni.shape.identity",            "Identity",                     STRING) \
    X(mission,                  "omni.mission",                   "Mission Assignment Event",     NONE)   \
    X(mission_type,             "omni.mission.type",              "Mission Type",                 STRING) \
    X(mission_source,           "omni.mission.source",            "Source ID",                    STRING) \
    X(mission_addressee,        "omni.mission.addressee",         "Addressee ID",                 STRING) \
    X(weather,                  "omni.weather",                   "Weather Event",                NONE)   \
    X(weather_category,         "omni.weather.category",          "Category",                     STRING) \
    X(airfield,                 "omni.airfield",                  "Airfield Status Event",        NONE)   \
    X(airfield_icao,            "omni.airfield.icao",             "ICAO Code",                    STRING) \
    X(airfield_status,          "omni.airfield.status",           "Status",                       STRING) \
    X(pr,                       "omni.pr",                        "Personnel Recovery Event",     NONE)   \
    X(pr_type,                  "omni.pr.type",                   "PR Type",                      STRING) \
    X(pr_status,                "omni.pr.status",                 "Status",                       STRING) \
    X(entity_mgmt,              "omni.entity_mgmt",               "Entity Management Event",      NONE)   \
    X(entity_mgmt_action,       "omni.entity_mgmt.action",        "Action",                       STRING) \
    X(network_mgmt,             "omni.network_mgmt",              "Network Management Event",     NONE)   \
    X(network_mgmt_type,        "omni.network_mgmt.type",         "Type",                         STRING) \
    X(network_mgmt_message,     "omni.network_mgmt.message",      "Message",                      STRING) \
    X(nav_vector,               "omni.nav_vector",                "Navigation Vector Event",      NONE)   \
    X(nav_course,               "omni.nav_vector.course",         "Course",                       DOUBLE) \
    X(nav_speed,                "omni.nav_vector.speed",          "Speed",                        DOUBLE) \
    X(nav_altitude,             "omni.nav_vector.altitude",       "Altitude",                     DOUBLE) \
    X(image,                    "omni.image",                     "Image Event",                  NONE)   \
    X(alert,                    "omni.alert",                     "Alert Event",                  NONE)   \
    X(alert_message,            "omni.alert.message",             "Message",                      STRING) \
    X(alert_category,           "omni.alert.category",            "Category",                     STRING) \
    X(alert_state,              "omni.alert.state",               "State",                        STRING) \
    X(alert_type,               "omni.alert.type",                "Type",                         STRING) \
    X(flight_path,              "omni.flight_path",               "Flight Path Event",            NONE)   \
    X(flight_path_seq,          "omni.flight_path.sequence",      "Sequence Number",              UINT32) \
    X(flight_path_points,       "omni.flight_path.total_points",  "Total Points",                 UINT32) \
    X(geopoint,                 "omni.geopoint",                  "Geopoint",                     NONE)   \
    X(geopoint_lat,             "omni.geopoint.lat",              "Latitude",                     DOUBLE) \
    X(geopoint_lon,             "omni.geopoint.lon",              "Longitude",                    DOUBLE) \
    X(geopoint_hae,             "omni.geopoint.hae",              "Height Above Ellipsoid",       DOUBLE) \
    X(geopoint_ce,              "omni.geopoint.ce",               "Circular Error",               DOUBLE) \
    X(geopoint_le,              "omni.geopoint.le",               "Linear Error",                 DOUBLE) \
    X(geopoint_course,          "omni.geopoint.course",           "Course",                       DOUBLE) \
    X(geopoint_speed,           "omni.geopoint.speed",            "Speed",                        DOUBLE)

// X(ident, abbrev, summary, Group, Severity)
#define DISSECTOR_EXPERTS(X) \
    X(tak_malformed,    "tak.expert.malformed",    "Malformed TAK Message",     MALFORMED, ERROR) \
    X(tak_unsupported,  "tak.expert.unsupported",  "Unsupported Message Type",  UNDECODED, WARN)  \
    X(omni_malformed,   "omni.expert.malformed",   "Malformed OMNI Message",    MALFORMED, ERROR) \
    X(omni_unsupported, "omni.expert.unsupported", "Unsupported Message Type",  UNDECODED, WARN)

namespace hf {

#define X_DECL(ident, abbrev, name, type) extern const FieldInfo ident;
TAK_FIELDS(X_DECL)
OMNI_FIELDS(X_DECL)
#undef X_DECL

// Every registered field, TAK first, in declaration order.
const std::vector<const FieldInfo*>& all_fields();

} // namespace hf

namespace ei {

#define X_DECL(ident, abbrev, summary, group, severity) extern const ExpertDef ident;
DISSECTOR_EXPERTS(X_DECL)
#undef X_DECL

const std::vector<const ExpertDef*>& all_experts();

} // namespace ei
