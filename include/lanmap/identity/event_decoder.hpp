#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanmap/model/device.hpp"

namespace lanmap::identity {

struct DeviceSighted {
    model::Device device;
};

// Either field may be empty, never both.
struct DeviceRemoved {
    std::string id;
    std::string address;
};

struct SnapshotReceived {
    std::vector<model::Device> devices;
    std::size_t rejected{0};
};

struct UnrecognizedEvent {
    std::string type;
    std::string reason;
};

using Event = std::variant<DeviceSighted, DeviceRemoved, SnapshotReceived, UnrecognizedEvent>;

enum class EventCategory {
    Sighting,
    Metrics,
    Removal,
    Snapshot,
    Unknown
};

EventCategory classify_event(std::string_view type);

// Decodes a push-stream envelope {"type"|"event": ..., "payload"|"data": ...}.
// Without a payload field the remaining envelope fields are the body.
Event decode_message(const nlohmann::json& envelope);

// Decodes the body of a named event.
Event decode_event(std::string_view type, const nlohmann::json& body);

// Accepts {"devices": [...]}, {"nodes": [...]} or a bare array. Entries that
// do not normalize are dropped and counted in SnapshotReceived::rejected.
// Returns std::nullopt when the body has none of these shapes.
std::optional<SnapshotReceived> decode_snapshot(const nlohmann::json& body);

}  // namespace lanmap::identity
