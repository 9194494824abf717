#include "lanmap/model/device.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanmap::model {

namespace {

std::string lowercase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace

std::optional<double> Device::response_time_ms() const {
    if (!metrics.is_object()) {
        return std::nullopt;
    }
    auto it = metrics.find("responseTime");
    if (it == metrics.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::string_view to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Router:
            return "router";
        case DeviceKind::Switch:
            return "switch";
        case DeviceKind::Server:
            return "server";
        case DeviceKind::Workstation:
            return "workstation";
        case DeviceKind::Unknown:
            break;
    }
    return "unknown";
}

std::string_view to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:
            return "online";
        case DeviceStatus::Offline:
            return "offline";
        case DeviceStatus::Unknown:
            break;
    }
    return "unknown";
}

DeviceKind parse_device_kind(std::string_view text) {
    const auto value = lowercase(text);
    if (value == "router") {
        return DeviceKind::Router;
    }
    if (value == "switch") {
        return DeviceKind::Switch;
    }
    if (value == "server") {
        return DeviceKind::Server;
    }
    if (value == "workstation") {
        return DeviceKind::Workstation;
    }
    return DeviceKind::Unknown;
}

DeviceStatus parse_device_status(std::string_view text) {
    const auto value = lowercase(text);
    if (value == "online" || value == "up") {
        return DeviceStatus::Online;
    }
    if (value == "offline" || value == "down") {
        return DeviceStatus::Offline;
    }
    return DeviceStatus::Unknown;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace lanmap::model
