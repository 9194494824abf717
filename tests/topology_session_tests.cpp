#include "lanmap/session/topology_session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

using lanmap::model::ConnectionState;
using lanmap::model::DeviceStatus;
using lanmap::model::LayoutStrategy;
using lanmap::model::LinkType;
using lanmap::model::TopologyView;
using lanmap::session::SessionSettings;
using lanmap::session::TopologySession;
using json = nlohmann::json;

namespace {

json office_snapshot() {
    return json{{"type", "initialData"},
                {"payload",
                 {{"devices",
                   json::array({
                       json{{"_id", "gw"}, {"ipAddress", "10.0.0.1"}, {"deviceType", "router"}, {"status", "online"}},
                       json{{"_id", "nas"}, {"ipAddress", "10.0.0.20"}, {"deviceType", "server"}, {"status", "online"}},
                       json{{"_id", "pc"}, {"ipAddress", "10.0.0.30"}, {"deviceType", "workstation"}, {"status", "offline"}},
                       json{{"_id", "cam"}, {"ipAddress", "10.0.0.40"}, {"status", "online"}},
                   })}}}};
}

struct Recorder {
    std::vector<TopologyView> views;

    TopologySession::Listener listener() {
        return [this](const TopologyView& view) { views.push_back(view); };
    }
};

}  // namespace

TEST_CASE("A snapshot over the push stream publishes a router star", "[session]") {
    TopologySession session;
    Recorder recorder;
    session.subscribe(recorder.listener());

    session.ingest_message(office_snapshot());

    REQUIRE(recorder.views.size() == 1);
    const auto& view = recorder.views.back();
    CHECK(view.devices.size() == 4);
    CHECK(view.edges.size() == 3);
    for (const auto& edge : view.edges) {
        CHECK(edge.source == "gw");
        CHECK(edge.link_type == LinkType::Gateway);
    }
    for (const auto& device : view.devices) {
        CHECK(device.layout_position.has_value());
    }
    CHECK(view.counters.total == 4);
    CHECK(view.counters.online == 3);
    CHECK(view.counters.offline == 1);
    CHECK(view.counters.active_edges == 2);
    CHECK(view.revision == session.store().revision());

    REQUIRE(session.view() != nullptr);
    CHECK(session.view()->edges.size() == 3);
    REQUIRE(session.view()->groups.size() == 1);
    CHECK(session.view()->groups.front().gateway_id == "gw");
}

TEST_CASE("Two peers without a gateway are meshed", "[session]") {
    TopologySession session;
    session.ingest_message(json{{"type", "deviceFound"}, {"payload", {{"ip", "192.168.1.10"}, {"status", "online"}}}});
    session.ingest_message(json{{"type", "deviceFound"}, {"payload", {{"ip", "192.168.1.20"}, {"status", "online"}}}});

    const auto view = session.view();
    REQUIRE(view->edges.size() == 1);
    CHECK(view->edges.front().link_type == LinkType::Mesh);
    CHECK(view->edges.front().active());
}

TEST_CASE("An address sighting followed by its id stays one device", "[session]") {
    TopologySession session;
    session.ingest_message(json{{"type", "deviceFound"}, {"payload", {{"ip", "10.0.0.7"}, {"name", "printer"}}}});
    session.ingest_message(
        json{{"type", "deviceUpdated"}, {"payload", {{"id", "p-1"}, {"ipAddress", "10.0.0.7"}, {"status", "online"}}}});

    const auto view = session.view();
    REQUIRE(view->devices.size() == 1);
    const auto& device = view->devices.front();
    CHECK(device.id == "p-1");
    CHECK(device.display_name == "printer");
    CHECK(device.status == DeviceStatus::Online);
}

TEST_CASE("An address sighting adopts the id from a later pull", "[session]") {
    TopologySession session;
    session.ingest_message(json{{"type", "deviceFound"}, {"payload", {{"ip", "10.0.0.5"}}}});
    REQUIRE(session.view()->devices.size() == 1);
    CHECK(session.view()->devices.front().id == "10.0.0.5");

    session.ingest_snapshot(json{{"devices", json::array({json{{"id", "abc"}, {"ipAddress", "10.0.0.5"}}})}});

    const auto view = session.view();
    REQUIRE(view->devices.size() == 1);
    CHECK(view->devices.front().id == "abc");
    CHECK(view->devices.front().address == "10.0.0.5");
    CHECK_FALSE(view->devices.front().provisional_id);
    CHECK_FALSE(session.store().find("10.0.0.5").has_value());
}

TEST_CASE("Unchanged input does not republish", "[session]") {
    TopologySession session;
    Recorder recorder;
    session.subscribe(recorder.listener());

    session.ingest_message(office_snapshot());
    session.ingest_message(office_snapshot());
    session.ingest_message(json{{"type", "chat.message"}, {"payload", {{"text", "hi"}}}});
    session.ingest_message(json{{"type", "device.deleted"}, {"payload", "unknown-id"}});

    CHECK(recorder.views.size() == 1);
}

TEST_CASE("Removals resolve by id or by address", "[session]") {
    TopologySession session;
    session.ingest_message(office_snapshot());

    session.ingest_message(json{{"type", "device.deleted"}, {"payload", {{"id", "cam"}}}});
    CHECK(session.view()->devices.size() == 3);

    session.ingest_message(json{{"type", "deviceRemoved"}, {"payload", {{"ipAddress", "10.0.0.30"}}}});
    const auto view = session.view();
    CHECK(view->devices.size() == 2);
    CHECK(view->find_device("pc") == nullptr);
    CHECK(view->edges.size() == 1);
}

TEST_CASE("Pulled snapshots merge without deleting pushed devices", "[session]") {
    TopologySession session;
    session.ingest_message(json{{"type", "deviceFound"}, {"payload", {{"id", "extra"}, {"ip", "10.0.0.99"}}}});

    session.ingest_snapshot(json::array({json{{"_id", "gw"}, {"ipAddress", "10.0.0.1"}, {"type", "router"}}}));
    CHECK(session.view()->devices.size() == 2);

    const auto revision = session.store().revision();
    session.ingest_snapshot(json{{"message", "not a device list"}});
    CHECK(session.store().revision() == revision);
}

TEST_CASE("Changing the layout strategy only relayouts", "[session]") {
    TopologySession session(SessionSettings{LayoutStrategy::Grid, {}, 11});
    Recorder recorder;
    session.ingest_message(office_snapshot());
    session.subscribe(recorder.listener());

    const auto before = session.view();
    session.set_layout_strategy(LayoutStrategy::Circular);

    REQUIRE(recorder.views.size() == 1);
    const auto& after = recorder.views.back();
    CHECK(after.strategy == LayoutStrategy::Circular);
    CHECK(after.revision == before->revision);
    REQUIRE(after.edges.size() == before->edges.size());
    for (std::size_t i = 0; i < after.edges.size(); ++i) {
        CHECK(after.edges[i].id == before->edges[i].id);
    }
    CHECK_FALSE(after.devices.front().layout_position == before->devices.front().layout_position);

    session.set_layout_strategy(LayoutStrategy::Circular);
    CHECK(recorder.views.size() == 1);
}

TEST_CASE("A failing listener does not starve the others", "[session]") {
    TopologySession session;
    Recorder recorder;
    session.subscribe([](const TopologyView&) { throw std::runtime_error("boom"); });
    const auto id = session.subscribe(recorder.listener());

    session.ingest_message(office_snapshot());
    CHECK(recorder.views.size() == 1);

    session.unsubscribe(id);
    session.ingest_message(json{{"type", "device.deleted"}, {"payload", "cam"}});
    CHECK(recorder.views.size() == 1);
}

TEST_CASE("A stopped session ignores input and forgets its devices", "[session]") {
    TopologySession session;
    Recorder recorder;
    session.ingest_message(office_snapshot());
    session.subscribe(recorder.listener());

    session.stop();
    CHECK_FALSE(session.accepting());
    CHECK(session.store().size() == 0);
    CHECK(session.view()->devices.empty());
    CHECK(session.view()->connection.state == ConnectionState::Disconnected);

    session.ingest_message(office_snapshot());
    session.ingest_snapshot(json::array({json{{"id", "late"}, {"ip", "10.0.0.5"}}}));
    CHECK(session.store().size() == 0);
    CHECK(recorder.views.empty());

    session.force_resync();
    session.reconnect();
    session.stop();
}
