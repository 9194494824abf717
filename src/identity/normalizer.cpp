#include "lanmap/identity/normalizer.hpp"

#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>

namespace lanmap::identity {

namespace {

using json = nlohmann::json;
using model::Device;

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

const json* find_field(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string first_string(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it == object.end() || !it->is_string()) {
            continue;
        }
        auto value = trim(it->get_ref<const std::string&>());
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

std::string id_from_value(const json& value) {
    if (value.is_string()) {
        return trim(value.get_ref<const std::string&>());
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    if (value.is_object()) {
        auto oid = value.find("$oid");
        if (oid != value.end() && oid->is_string()) {
            return trim(oid->get_ref<const std::string&>());
        }
    }
    return {};
}

std::string resolve_id(const json& object) {
    for (const char* name : {"id", "_id", "deviceId"}) {
        auto it = object.find(name);
        if (it == object.end()) {
            continue;
        }
        auto id = id_from_value(*it);
        if (!id.empty()) {
            return id;
        }
    }
    return {};
}

using Clock = std::chrono::system_clock;

// Epoch offsets a system_clock::time_point can hold.
constexpr std::int64_t kMaxEpochMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
constexpr std::int64_t kMaxEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
constexpr std::int64_t kMinEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count();
// Headroom for the fraction and zone offset applied after conversion.
constexpr std::int64_t kOffsetMarginSeconds = 2 * 24 * 60 * 60;

std::time_t to_utc_time_t(std::tm tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text) {
    // Date and time part is fixed width: YYYY-MM-DDTHH:MM:SS
    constexpr std::size_t kBaseLength = 19;
    if (text.size() < kBaseLength) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss{std::string(text.substr(0, kBaseLength))};
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    std::size_t pos = kBaseLength;
    std::chrono::milliseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        long long millis = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
        fraction = std::chrono::milliseconds(millis);
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        const char designator = text[pos];
        if (designator == 'Z' || designator == 'z') {
            ++pos;
        } else if (designator == '+' || designator == '-') {
            auto zone = text.substr(pos + 1);
            if (zone.size() != 5 || zone[2] != ':' || !std::isdigit(static_cast<unsigned char>(zone[0])) ||
                !std::isdigit(static_cast<unsigned char>(zone[1])) ||
                !std::isdigit(static_cast<unsigned char>(zone[3])) ||
                !std::isdigit(static_cast<unsigned char>(zone[4]))) {
                return std::nullopt;
            }
            const int hours = (zone[0] - '0') * 10 + (zone[1] - '0');
            const int minutes = (zone[3] - '0') * 10 + (zone[4] - '0');
            offset = std::chrono::minutes(hours * 60 + minutes);
            if (designator == '-') {
                offset = -offset;
            }
            pos = text.size();
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const auto seconds = static_cast<std::int64_t>(to_utc_time_t(tm));
    if (seconds > kMaxEpochSeconds - kOffsetMarginSeconds || seconds < kMinEpochSeconds + kOffsetMarginSeconds) {
        return std::nullopt;
    }
    auto tp = Clock::time_point(std::chrono::seconds(seconds));
    return tp + fraction - offset;
}

std::optional<model::DeviceKind> resolve_kind(const json& object) {
    const json* value = find_field(object, {"kind", "type", "deviceType"});
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return model::parse_device_kind(trim(value->get_ref<const std::string&>()));
}

std::optional<model::DeviceStatus> resolve_status(const json& object) {
    const json* value = find_field(object, {"status", "state"});
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return model::parse_device_status(trim(value->get_ref<const std::string&>()));
}

std::optional<Device> normalize_object(const json& object) {
    Device device;
    device.address = first_string(object, {"ip", "ipAddress", "address"});
    auto id = resolve_id(object);

    if (id.empty() && device.address.empty()) {
        return std::nullopt;
    }
    if (id.empty()) {
        device.id = device.address;
        device.provisional_id = true;
    } else {
        device.id = std::move(id);
    }

    device.display_name = first_string(object, {"displayName", "name", "hostname", "label"});
    device.kind = resolve_kind(object);
    device.status = resolve_status(object);
    device.mac = first_string(object, {"mac", "macAddress"});
    device.vendor = first_string(object, {"vendor"});

    if (auto metrics = object.find("metrics"); metrics != object.end() && metrics->is_object()) {
        device.metrics = *metrics;
    }
    if (auto response = object.find("responseTime"); response != object.end() && response->is_number()) {
        device.metrics["responseTime"] = *response;
    }

    if (const json* seen = find_field(object, {"lastSeen", "last_seen"}); seen != nullptr) {
        device.last_seen = parse_timestamp(*seen);
    }
    if (!device.last_seen && device.metrics.contains("lastSeen")) {
        device.last_seen = parse_timestamp(device.metrics.at("lastSeen"));
    }

    return device;
}

}  // namespace

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const json& value) {
    if (value.is_number_unsigned()) {
        const auto millis = value.get<std::uint64_t>();
        if (millis > static_cast<std::uint64_t>(kMaxEpochMillis)) {
            return std::nullopt;
        }
        return Clock::time_point(std::chrono::milliseconds(static_cast<std::int64_t>(millis)));
    }
    if (value.is_number_integer()) {
        const auto millis = value.get<std::int64_t>();
        if (millis < 0 || millis > kMaxEpochMillis) {
            return std::nullopt;
        }
        return Clock::time_point(std::chrono::milliseconds(millis));
    }
    if (value.is_string()) {
        return parse_iso8601(trim(value.get_ref<const std::string&>()));
    }
    return std::nullopt;
}

std::optional<Device> normalize(const json& raw) {
    try {
        if (!raw.is_object()) {
            return std::nullopt;
        }
        auto nested = raw.find("device");
        if (nested != raw.end() && nested->is_object()) {
            return normalize_object(*nested);
        }
        return normalize_object(raw);
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

}  // namespace lanmap::identity
