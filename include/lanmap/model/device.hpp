#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lanmap::model {

enum class DeviceKind {
    Router,
    Switch,
    Server,
    Workstation,
    Unknown
};

enum class DeviceStatus {
    Online,
    Offline,
    Unknown
};

struct Point {
    double x{0.0};
    double y{0.0};

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
};

struct Device {
    std::string id;
    // Set when id was derived from address because no server id was known.
    bool provisional_id{false};
    std::string address;
    std::string display_name;
    std::optional<DeviceKind> kind;
    std::optional<DeviceStatus> status;
    std::optional<std::chrono::system_clock::time_point> last_seen;
    nlohmann::json metrics = nlohmann::json::object();
    std::string mac;
    std::string vendor;
    std::optional<Point> layout_position;

    DeviceKind kind_or_unknown() const { return kind.value_or(DeviceKind::Unknown); }
    DeviceStatus status_or_unknown() const { return status.value_or(DeviceStatus::Unknown); }
    bool online() const { return status == DeviceStatus::Online; }

    std::optional<double> response_time_ms() const;
};

std::string_view to_string(DeviceKind kind);
std::string_view to_string(DeviceStatus status);

// Case-insensitive. Unrecognised names map to Unknown.
DeviceKind parse_device_kind(std::string_view text);
DeviceStatus parse_device_status(std::string_view text);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace lanmap::model
