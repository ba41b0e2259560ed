#include <gtest/gtest.h>

#include "dissector.h"
#include "field_registry.h"
#include "omni_builders.h"
#include "proto_writer.h"

using testing_pb::Bytes;
using testing_pb::Writer;

namespace {

pb::ByteSpan span(const Bytes& b) { return pb::ByteSpan(b.data(), b.size()); }

Writer alias(const std::string& id) {
    Writer a;
    a.string(1, "NATO").string(2, "track").string(3, "LINK16").string(4, id);
    return a;
}

Writer track_event() {
    Writer geo;
    geo.float64(1, 35.0).float64(2, -120.5).wrapped_double(3, 1200.0).wrapped_double(6, 90.0);
    return Writer().message(1, geo);
}

// BaseEvent header fields shared by most tests
Writer base(uint64_t entity_id) {
    Writer w;
    w.varint(1, entity_id)
     .message(2, Writer().string(1, "SRC-1").string(2, "NET-A"))
     .message(4, Writer().message(1, Writer().varint(1, 1700000000).varint(2, 500)).varint(2, 1000))
     .message(5, alias("A-1"))
     .message(5, alias("A-2"))
     .varint(9, 7);
    return w;
}

struct Result {
    size_t consumed;
    DissectOutput out;
};

Result dissect(const Writer& w) {
    Result r;
    r.consumed = OmniDissector().dissect(span(w.data()), r.out);
    return r;
}

std::string text_of(const DissectOutput& out, const char* abbrev) {
    const FieldNode* n = out.root.find(abbrev);
    return n ? field_to_string(n->value) : "<missing>";
}

} // namespace

TEST(OmniDissector, TrackEvent) {
    Writer w = base(42);
    w.message(12, track_event());
    Result r = dissect(w);

    EXPECT_EQ(r.consumed, w.size());
    EXPECT_TRUE(r.out.experts.empty());
    EXPECT_EQ(r.out.protocol_column, "OMNI");
    EXPECT_EQ(r.out.info_column, "OMNI [Track #42]");
    EXPECT_EQ(r.out.root.display(),
              "OMNI Message, Version: 0, Length: " + std::to_string(w.size()) + ", Protocol: omni");

    EXPECT_EQ(r.out.root.find("omni.event")->display(), "OMNI Event: Track (Entity 42)");
    EXPECT_EQ(text_of(r.out, "omni.event_type"), "Track");
    EXPECT_EQ(text_of(r.out, "omni.entity_id"), "42");
    EXPECT_EQ(text_of(r.out, "omni.seq_num"), "7");

    EXPECT_EQ(r.out.root.find("omni.track")->display(), "Track Event: Track Event");
    EXPECT_EQ(r.out.root.find("omni.geopoint")->display(), "Geopoint: 35.000000, -120.500000");
    EXPECT_DOUBLE_EQ(std::get<double>(r.out.root.find("omni.geopoint.hae")->value), 1200.0);
    EXPECT_DOUBLE_EQ(std::get<double>(r.out.root.find("omni.geopoint.course")->value), 90.0);
    EXPECT_EQ(r.out.root.find("omni.geopoint.ce"), nullptr);
}

TEST(OmniDissector, HeaderSubMessages) {
    Writer w = base(1);
    Result r = dissect(w);

    EXPECT_EQ(r.out.root.find("omni.origin")->display(), "Origin: SRC-1");
    EXPECT_EQ(text_of(r.out, "omni.origin.source_net"), "NET-A");

    EXPECT_EQ(std::get<uint64_t>(r.out.root.find("omni.time.created")->value), 1700000000u);
    EXPECT_EQ(std::get<uint64_t>(r.out.root.find("omni.time.created_nanos")->value), 500u);
    EXPECT_EQ(std::get<uint64_t>(r.out.root.find("omni.time.updated")->value), 1000u);
    EXPECT_EQ(r.out.root.find("omni.time.timeout"), nullptr);

    auto aliases = r.out.root.find_all("omni.alias");
    ASSERT_EQ(aliases.size(), 2u);
    EXPECT_EQ(aliases[0]->display(), "Alias: A-1");
    EXPECT_EQ(aliases[1]->display(), "Alias: A-2");
}

TEST(OmniDissector, EntityIdKeepsFull64Bits) {
    const uint64_t id = (1ull << 63) + 5;
    Writer w;
    w.varint(1, id).message(11, Writer().string(1, "opaque"));
    Result r = dissect(w);

    EXPECT_EQ(r.out.info_column, "OMNI [Other #9223372036854775813]");
    EXPECT_EQ(text_of(r.out, "omni.entity_id"), "9223372036854775813");
    EXPECT_NE(r.out.root.find("omni.other"), nullptr);
}

TEST(OmniDissector, LowestOneofFieldWins) {
    Writer w;
    w.varint(1, 3)
     .message(37, Writer().string(1, "should lose"))
     .message(12, track_event());
    Result r = dissect(w);

    EXPECT_EQ(r.out.info_column, "OMNI [Track #3]");
    EXPECT_NE(r.out.root.find("omni.track"), nullptr);
    EXPECT_EQ(r.out.root.find("omni.alert"), nullptr);
}

TEST(OmniDissector, NoEventIsUnknown) {
    Writer w;
    w.varint(1, 5).varint(9, 1);
    Result r = dissect(w);
    EXPECT_EQ(r.consumed, w.size());
    EXPECT_EQ(r.out.info_column, "OMNI [Unknown #5]");
    EXPECT_EQ(text_of(r.out, "omni.event_type"), "Unknown");
}

TEST(OmniDissector, ScalarInOneofSlotStillNamesType) {
    Writer w;
    w.varint(1, 8).varint(14, 1);
    Result r = dissect(w);
    EXPECT_EQ(r.out.info_column, "OMNI [Sensor #8]");
    EXPECT_EQ(r.out.root.find("omni.sensor"), nullptr);
}

TEST(OmniDissector, AlertEnumsIncludingUnknownValues) {
    Writer alert;
    alert.string(1, "Fuel low").varint(2, 9).varint(3, 2).varint(6, 99);
    Writer w;
    w.varint(1, 11).message(37, alert);
    Result r = dissect(w);

    EXPECT_EQ(r.out.root.find("omni.alert")->display(), "Alert Event: Fuel low");
    EXPECT_EQ(text_of(r.out, "omni.alert.category"), "9");
    EXPECT_EQ(text_of(r.out, "omni.alert.state"), "ACTIVE");
    EXPECT_EQ(text_of(r.out, "omni.alert.type"), "99");
}

TEST(OmniDissector, AlertWithoutMessageUsesFallback) {
    Writer w;
    w.varint(1, 11).message(37, Writer().varint(2, 1));
    Result r = dissect(w);
    EXPECT_EQ(r.out.root.find("omni.alert")->display(), "Alert Event: Alert");
    EXPECT_EQ(text_of(r.out, "omni.alert.category"), "CAT_1 (Critical)");
}

TEST(OmniDissector, ChatSenderFromAlias) {
    Writer w;
    w.varint(1, 2).message(16, Writer().string(1, "hello").message(3, alias("BRAVO")));
    Result r = dissect(w);
    EXPECT_EQ(r.out.root.find("omni.chat")->display(), "Chat Event: hello");
    EXPECT_EQ(text_of(r.out, "omni.chat.sender"), "BRAVO");
}

TEST(OmniDissector, PlayerCallsign) {
    Writer w;
    w.varint(1, 2).message(13, Writer().message(1, Writer().string(1, "VIPER 1")));
    Result r = dissect(w);
    EXPECT_EQ(r.out.root.find("omni.player")->display(), "Player Event: VIPER 1");
}

TEST(OmniDissector, ShapeVariantAndIdentity) {
    Writer shape;
    shape.bytes(3, {}).varint(8, 3).varint(9, 7);
    Writer w;
    w.varint(1, 4).message(15, shape);
    Result r = dissect(w);

    EXPECT_EQ(r.out.root.find("omni.shape")->display(), "Shape Event: Rectangle");
    EXPECT_EQ(text_of(r.out, "omni.shape.environment"), "AIR");
    EXPECT_EQ(text_of(r.out, "omni.shape.identity"), "HOSTILE");
}

TEST(OmniDissector, MissionAssignment) {
    Writer mission;
    mission.varint(1, 8).message(2, alias("SRC")).message(3, alias("DST"));
    Writer w;
    w.varint(1, 4).message(17, mission);
    Result r = dissect(w);

    EXPECT_EQ(r.out.info_column, "OMNI [MissionAssignment #4]");
    EXPECT_EQ(text_of(r.out, "omni.mission.type"), "TRACK");
    EXPECT_EQ(text_of(r.out, "omni.mission.source"), "SRC");
    EXPECT_EQ(text_of(r.out, "omni.mission.addressee"), "DST");
}

TEST(OmniDissector, PersonnelRecoveryStatusIsNumeric) {
    Writer w;
    w.varint(1, 4).message(23, Writer().varint(1, 4).varint(2, 3));
    Result r = dissect(w);
    EXPECT_EQ(text_of(r.out, "omni.pr.type"), "INITIATE");
    EXPECT_EQ(text_of(r.out, "omni.pr.status"), "3");
}

TEST(OmniDissector, NetworkManagementError) {
    Writer w;
    w.varint(1, 4).message(26, Writer().message(3, Writer().varint(1, 2).string(2, "link timeout")));
    Result r = dissect(w);
    EXPECT_EQ(r.out.root.find("omni.network_mgmt")->display(), "Network Management Event: Error");
    EXPECT_EQ(text_of(r.out, "omni.network_mgmt.message"), "link timeout");
}

TEST(OmniDissector, EntityManagementAction) {
    Writer link;
    link.varint(1, 4).message(25, Writer().bytes(2, {}));
    EXPECT_EQ(text_of(dissect(link).out, "omni.entity_mgmt.action"), "Link");

    Writer none;
    none.varint(1, 4).message(25, Writer());
    EXPECT_EQ(text_of(dissect(none).out, "omni.entity_mgmt.action"), "Unknown");
}

TEST(OmniDissector, FlightPathWrappers) {
    Writer w;
    w.varint(1, 6).message(42, Writer().wrapped_uint(1, 3).wrapped_uint(4, 120));
    Result r = dissect(w);
    EXPECT_EQ(r.out.root.find("omni.flight_path")->display(), "Flight Path Event: Flight Path");
    EXPECT_EQ(std::get<uint64_t>(r.out.root.find("omni.flight_path.sequence")->value), 3u);
    EXPECT_EQ(std::get<uint64_t>(r.out.root.find("omni.flight_path.total_points")->value), 120u);
}

TEST(OmniDissector, NavigationVector) {
    Writer w;
    w.varint(1, 6).message(29, Writer().wrapped_double(1, 45.0).wrapped_double(2, 250.5));
    Result r = dissect(w);
    EXPECT_DOUBLE_EQ(std::get<double>(r.out.root.find("omni.nav_vector.speed")->value), 250.5);
    EXPECT_EQ(r.out.root.find("omni.nav_vector.altitude"), nullptr);
}

TEST(OmniDissector, TruncatedTailKeepsHeader) {
    Writer w;
    w.varint(1, 77).varint(9, 2);
    // field 12, declares 64 bytes, carries 2
    w.raw({0x62, 0x40, 0x0A, 0x00});
    Result r = dissect(w);

    EXPECT_EQ(r.consumed, w.size());
    EXPECT_EQ(r.out.info_column, "OMNI [Unknown #77]");
    EXPECT_EQ(text_of(r.out, "omni.seq_num"), "2");
}

TEST(OmniDissector, RejectsNonHeuristicPayloads) {
    Bytes framed = testing_pb::stream_frame({0x08, 0x01});
    DissectOutput out;
    EXPECT_EQ(OmniDissector().dissect(span(framed), out), 0u);
    EXPECT_TRUE(out.has_expert(ei::omni_unsupported));

    Bytes doc = testing_pb::text("<?xml version=\"1.0\"?>");
    DissectOutput out2;
    EXPECT_EQ(OmniDissector().dissect(span(doc), out2), 0u);
}

TEST(OmniDissector, EventCasesAreAscending) {
    const OneofTable& cases = omni::event_cases();
    ASSERT_FALSE(cases.empty());
    for (size_t i = 1; i < cases.size(); ++i) {
        EXPECT_LT(cases[i - 1].field_number, cases[i].field_number);
        EXPECT_TRUE(cases[i].builder != nullptr) << cases[i].name;
    }
}
