#include "lanmap/identity/event_decoder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace lanmap::identity;
using lanmap::model::DeviceStatus;
using json = nlohmann::json;

TEST_CASE("Event names are classified by category", "[normalizer]") {
    CHECK(classify_event("deviceFound") == EventCategory::Sighting);
    CHECK(classify_event("discovery.deviceFound") == EventCategory::Sighting);
    CHECK(classify_event("device.metrics") == EventCategory::Metrics);
    CHECK(classify_event("dashboard.deviceDeleted") == EventCategory::Removal);
    CHECK(classify_event("initialData") == EventCategory::Snapshot);
    CHECK(classify_event("chat.message") == EventCategory::Unknown);
}

TEST_CASE("Sighting envelopes decode in every framing", "[normalizer]") {
    const json device = {{"_id", "d-1"}, {"ipAddress", "10.0.0.2"}, {"status", "online"}};

    SECTION("type and payload") {
        auto event = decode_message(json{{"type", "deviceFound"}, {"payload", device}});
        auto* sighted = std::get_if<DeviceSighted>(&event);
        REQUIRE(sighted != nullptr);
        CHECK(sighted->device.id == "d-1");
    }

    SECTION("event and data") {
        auto event = decode_message(json{{"event", "device.updated"}, {"data", device}});
        REQUIRE(std::holds_alternative<DeviceSighted>(event));
    }

    SECTION("socket.io array") {
        auto event = decode_message(json::array({"deviceStatusChanged", device}));
        REQUIRE(std::holds_alternative<DeviceSighted>(event));
    }

    SECTION("flat envelope without payload") {
        auto event = decode_message(json{{"type", "device.sighted"}, {"id", "x"}, {"ip", "10.0.0.5"}});
        auto* sighted = std::get_if<DeviceSighted>(&event);
        REQUIRE(sighted != nullptr);
        CHECK(sighted->device.id == "x");
        CHECK(sighted->device.address == "10.0.0.5");
        // The envelope type is not read as a device kind.
        CHECK_FALSE(sighted->device.kind.has_value());
    }

    SECTION("flat removal envelope") {
        auto event = decode_message(json{{"event", "device.removed"}, {"deviceId", "gone"}});
        auto* removed = std::get_if<DeviceRemoved>(&event);
        REQUIRE(removed != nullptr);
        CHECK(removed->id == "gone");
    }

    SECTION("wrapped device body") {
        auto event = decode_event("dashboard.deviceAdded", json{{"device", device}});
        auto* sighted = std::get_if<DeviceSighted>(&event);
        REQUIRE(sighted != nullptr);
        CHECK(sighted->device.address == "10.0.0.2");
    }
}

TEST_CASE("Metrics events mark the device online", "[normalizer]") {
    auto event = decode_message(json{
        {"type", "device.metrics"},
        {"payload", {{"deviceId", "d-9"}, {"metrics", {{"responseTime", 4}, {"lastSeen", 1714557600000LL}}}}}});
    auto* sighted = std::get_if<DeviceSighted>(&event);
    REQUIRE(sighted != nullptr);
    CHECK(sighted->device.id == "d-9");
    CHECK(sighted->device.status == DeviceStatus::Online);
    CHECK(sighted->device.response_time_ms() == 4.0);
    CHECK(sighted->device.last_seen.has_value());

    auto anonymous = decode_event("device.metrics", json{{"metrics", {{"responseTime", 4}}}});
    CHECK(std::holds_alternative<UnrecognizedEvent>(anonymous));
}

TEST_CASE("Removal events accept ids, nested records and addresses", "[normalizer]") {
    SECTION("bare id string") {
        auto event = decode_event("device.deleted", json("d-1"));
        auto* removed = std::get_if<DeviceRemoved>(&event);
        REQUIRE(removed != nullptr);
        CHECK(removed->id == "d-1");
        CHECK(removed->address.empty());
    }

    SECTION("nested deletedDevice") {
        auto event = decode_event("dashboard.deviceDeleted",
                                  json{{"deletedDevice", {{"_id", {{"$oid", "abc"}}}, {"ipAddress", "10.0.0.3"}}}});
        auto* removed = std::get_if<DeviceRemoved>(&event);
        REQUIRE(removed != nullptr);
        CHECK(removed->id == "abc");
        CHECK(removed->address == "10.0.0.3");
    }

    SECTION("address only") {
        auto event = decode_event("deviceRemoved", json{{"ipAddress", "10.0.0.3"}});
        auto* removed = std::get_if<DeviceRemoved>(&event);
        REQUIRE(removed != nullptr);
        CHECK(removed->id.empty());
        CHECK(removed->address == "10.0.0.3");
    }

    SECTION("nothing to remove") {
        CHECK(std::holds_alternative<UnrecognizedEvent>(decode_event("device.removed", json::object())));
        CHECK(std::holds_alternative<UnrecognizedEvent>(decode_event("device.removed", json(17))));
    }
}

TEST_CASE("Snapshots keep valid entries and count rejects", "[normalizer]") {
    auto event = decode_message(json{
        {"type", "initialData"},
        {"payload", {{"devices", json::array({json{{"id", "a"}, {"ip", "10.0.0.1"}}, json{{"name", "nobody"}}, 5})}}}});
    auto* snapshot = std::get_if<SnapshotReceived>(&event);
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->devices.size() == 1);
    CHECK(snapshot->devices.front().id == "a");
    CHECK(snapshot->rejected == 2);

    auto nodes = decode_snapshot(json{{"nodes", json::array({json{{"ip", "10.0.0.7"}}})}});
    REQUIRE(nodes);
    CHECK(nodes->devices.size() == 1);

    auto bare = decode_snapshot(json::array());
    REQUIRE(bare);
    CHECK(bare->devices.empty());

    CHECK_FALSE(decode_snapshot(json{{"total", 3}}));
    CHECK(std::holds_alternative<UnrecognizedEvent>(decode_event("snapshot", json{{"total", 3}})));
}

TEST_CASE("Undecodable messages become UnrecognizedEvent", "[normalizer]") {
    auto unknown = decode_message(json{{"type", "chat.message"}, {"payload", {{"text", "hi"}}}});
    auto* unrecognized = std::get_if<UnrecognizedEvent>(&unknown);
    REQUIRE(unrecognized != nullptr);
    CHECK(unrecognized->type == "chat.message");

    CHECK(std::holds_alternative<UnrecognizedEvent>(decode_message(json{{"payload", {{"id", "x"}}}})));
    CHECK(std::holds_alternative<UnrecognizedEvent>(decode_message(json("hello"))));
    CHECK(std::holds_alternative<UnrecognizedEvent>(decode_message(json::array())));
    CHECK(std::holds_alternative<UnrecognizedEvent>(decode_message(json{{"type", "deviceFound"}, {"payload", 3}})));
}
