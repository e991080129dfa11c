#include <gtest/gtest.h>
#include "object.hpp"
#include <regex>
#include <set>

using namespace cmdb;

TEST(Object, KeysFollowKindAndName) {
    Machine m;
    m.name = "web-1";
    EXPECT_EQ(m.key(), "Machine/web-1");
    // Cluster-wide kinds ignore a stray namespace.
    m.ns = "prod";
    EXPECT_EQ(m.key(), "Machine/web-1");

    DiscoveredMachines latest;
    EXPECT_EQ(latest.key(), "DiscoveredMachines/discovered-machines");
    EXPECT_EQ(kind_prefix(kinds::machine), "Machine/");
}

TEST(Object, MachineJsonRoundTrip) {
    Machine m;
    m.guid = "g-1";
    m.name = "web-1";
    m.hostname = "web-1.example.net";
    m.zone = "zone-a";
    m.addresses = {"10.0.0.1", "fe80::1"};
    m.labels = {{"role", "web"}};
    m.creation_timestamp = 1000;
    m.updating_timestamp = 2000;

    Machine back;
    back.from_json(m.to_json());
    EXPECT_EQ(back.guid, "g-1");
    EXPECT_EQ(back.hostname, "web-1.example.net");
    EXPECT_EQ(back.addresses.size(), 2u);
    EXPECT_EQ(back.labels.at("role"), "web");
    EXPECT_EQ(back.creation_timestamp, 1000);
    ASSERT_TRUE(back.updating_timestamp);
    EXPECT_EQ(*back.updating_timestamp, 2000);
}

TEST(Object, MissingFieldsKeepDefaults) {
    MachineDigest d;
    decode_object(R"({"guid": "m1"})", d);
    EXPECT_EQ(d.guid, "m1");
    EXPECT_EQ(d.kind, kinds::machine_digest);
    EXPECT_EQ(d.state, digest_state::pending);
    EXPECT_TRUE(d.machines.empty());
    EXPECT_FALSE(d.updating_timestamp);

    decode_object(R"({"guid": "m2", "updating_timestamp": null})", d);
    EXPECT_EQ(d.guid, "m2");
}

TEST(Object, MalformedPayloadsAreRejected) {
    MachineDigest d;
    EXPECT_THROW(decode_object("", d), DecodeError);
    EXPECT_THROW(decode_object("{", d), DecodeError);
    EXPECT_THROW(decode_object("[]", d), DecodeError);
    EXPECT_THROW(decode_object("\"text\"", d), DecodeError);
    EXPECT_THROW(decode_object(R"({"guid": 7})", d), DecodeError);
    EXPECT_THROW(decode_object(R"({"machines": "m1"})", d), DecodeError);
    EXPECT_THROW(decode_object(R"({"kind": "Machine"})", d), DecodeError);
}

TEST(Object, NewDigestHasFreshIdentity) {
    std::set<std::string> seen;
    const std::regex uuid_v4("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    for (int i = 0; i < 50; ++i) {
        MachineDigest d = new_machine_digest();
        EXPECT_TRUE(std::regex_match(d.guid, uuid_v4)) << d.guid;
        EXPECT_EQ(d.name, d.guid);
        EXPECT_EQ(d.state, digest_state::pending);
        seen.insert(d.guid);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(ObjectList, DecodesRawRows) {
    ObjectList<Machine> list;
    EXPECT_EQ(list.kind(), kinds::machine);
    EXPECT_FALSE(list.has_namespace());
    list.append_raw(R"({"name": "a", "zone": "z1"})");
    list.append_raw(R"({"name": "b"})");
    ASSERT_EQ(list.items.size(), 2u);
    EXPECT_EQ(list.items[0].zone, "z1");
    EXPECT_THROW(list.append_raw("nope"), DecodeError);
    EXPECT_EQ(list.items.size(), 2u);
}
