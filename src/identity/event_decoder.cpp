#include "lanmap/identity/event_decoder.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <initializer_list>

#include "lanmap/identity/normalizer.hpp"

namespace lanmap::identity {

namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 9> kSightingEvents{
    "deviceFound",         "deviceUpdated",         "deviceStatusChanged",
    "device.discovered",   "device.updated",        "device.created",
    "discovery.deviceFound", "dashboard.deviceAdded", "device.sighted",
};

constexpr std::array<std::string_view, 1> kMetricsEvents{"device.metrics"};

constexpr std::array<std::string_view, 4> kRemovalEvents{
    "device.deleted",
    "device.removed",
    "deviceRemoved",
    "dashboard.deviceDeleted",
};

constexpr std::array<std::string_view, 3> kSnapshotEvents{"initialData", "snapshot", "devices"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view type) {
    return std::find(names.begin(), names.end(), type) != names.end();
}

std::string string_field(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it == object.end()) {
            continue;
        }
        if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
        if (it->is_number_integer()) {
            return std::to_string(it->get<std::int64_t>());
        }
        if (it->is_object()) {
            auto oid = it->find("$oid");
            if (oid != it->end() && oid->is_string()) {
                return oid->get<std::string>();
            }
        }
    }
    return {};
}

Event decode_sighting(std::string_view type, const json& body) {
    auto device = normalize(body);
    if (!device) {
        return UnrecognizedEvent{std::string(type), "payload has no resolvable id or address"};
    }
    return DeviceSighted{std::move(*device)};
}

Event decode_metrics(std::string_view type, const json& body) {
    auto device = normalize(body);
    if (!device) {
        return UnrecognizedEvent{std::string(type), "metrics payload has no deviceId"};
    }
    // A metrics report means the device answered.
    device->status = model::DeviceStatus::Online;
    return DeviceSighted{std::move(*device)};
}

Event decode_removal(std::string_view type, const json& body) {
    if (body.is_string()) {
        const auto& id = body.get_ref<const std::string&>();
        if (id.empty()) {
            return UnrecognizedEvent{std::string(type), "empty removal id"};
        }
        return DeviceRemoved{id, {}};
    }
    if (!body.is_object()) {
        return UnrecognizedEvent{std::string(type), "removal payload is not an object"};
    }

    const json* source = &body;
    if (auto nested = body.find("deletedDevice"); nested != body.end() && nested->is_object()) {
        source = &*nested;
    } else if (auto device = body.find("device"); device != body.end() && device->is_object()) {
        source = &*device;
    }

    DeviceRemoved removed;
    removed.id = string_field(*source, {"id", "deviceId", "_id"});
    removed.address = string_field(*source, {"ipAddress", "ip", "address"});
    if (removed.id.empty() && removed.address.empty()) {
        return UnrecognizedEvent{std::string(type), "removal payload has no id or address"};
    }
    return removed;
}

}  // namespace

EventCategory classify_event(std::string_view type) {
    if (contains(kSightingEvents, type)) {
        return EventCategory::Sighting;
    }
    if (contains(kMetricsEvents, type)) {
        return EventCategory::Metrics;
    }
    if (contains(kRemovalEvents, type)) {
        return EventCategory::Removal;
    }
    if (contains(kSnapshotEvents, type)) {
        return EventCategory::Snapshot;
    }
    return EventCategory::Unknown;
}

std::optional<SnapshotReceived> decode_snapshot(const json& body) {
    const json* list = nullptr;
    if (body.is_array()) {
        list = &body;
    } else if (body.is_object()) {
        for (const char* key : {"devices", "nodes"}) {
            auto it = body.find(key);
            if (it != body.end() && it->is_array()) {
                list = &*it;
                break;
            }
        }
    }
    if (list == nullptr) {
        return std::nullopt;
    }

    SnapshotReceived snapshot;
    snapshot.devices.reserve(list->size());
    for (const auto& entry : *list) {
        auto device = normalize(entry);
        if (device) {
            snapshot.devices.push_back(std::move(*device));
        } else {
            ++snapshot.rejected;
        }
    }
    return snapshot;
}

Event decode_event(std::string_view type, const json& body) {
    switch (classify_event(type)) {
        case EventCategory::Sighting:
            return decode_sighting(type, body);
        case EventCategory::Metrics:
            return decode_metrics(type, body);
        case EventCategory::Removal:
            return decode_removal(type, body);
        case EventCategory::Snapshot: {
            auto snapshot = decode_snapshot(body);
            if (!snapshot) {
                return UnrecognizedEvent{std::string(type), "snapshot payload has no device list"};
            }
            return std::move(*snapshot);
        }
        case EventCategory::Unknown:
            break;
    }
    return UnrecognizedEvent{std::string(type), "unknown event type"};
}

Event decode_message(const json& envelope) {
    try {
        // Socket.IO style framing: ["event", payload]
        if (envelope.is_array() && !envelope.empty() && envelope.front().is_string()) {
            const auto& type = envelope.front().get_ref<const std::string&>();
            return decode_event(type, envelope.size() > 1 ? envelope.at(1) : json::object());
        }
        if (!envelope.is_object()) {
            return UnrecognizedEvent{{}, "message is not an object"};
        }

        std::string type;
        for (const char* key : {"type", "event"}) {
            auto it = envelope.find(key);
            if (it != envelope.end() && it->is_string()) {
                type = it->get<std::string>();
                break;
            }
        }
        if (type.empty()) {
            return UnrecognizedEvent{{}, "message has no type"};
        }

        for (const char* key : {"payload", "data"}) {
            auto it = envelope.find(key);
            if (it != envelope.end()) {
                return decode_event(type, *it);
            }
        }
        // Flat envelope: the fields sit beside the type.
        json body = envelope;
        body.erase("type");
        body.erase("event");
        return decode_event(type, body);
    } catch (const json::exception& ex) {
        return UnrecognizedEvent{{}, ex.what()};
    }
}

}  // namespace lanmap::identity
