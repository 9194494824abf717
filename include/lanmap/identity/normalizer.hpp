#pragma once

#include <chrono>
#include <optional>

#include <nlohmann/json.hpp>

#include "lanmap/model/device.hpp"

namespace lanmap::identity {

/**
 * @brief Converts one raw device payload into the canonical device shape.
 *
 * Accepts a bare device object or one wrapped in a "device" field (a single
 * level is unwrapped). Field aliases:
 * - address: ip, ipAddress, address
 * - id: id, _id, deviceId (string, integer or {"$oid": ...})
 * - status: status, state ("up"/"down" accepted, any other value is unknown)
 * - kind: kind, type, deviceType
 * - name: displayName, name, hostname, label
 *
 * Returns std::nullopt when neither an id nor an address can be resolved, or
 * when the payload is not an object. Never throws. When no id is present the
 * address becomes the id and the device is flagged provisional_id.
 */
std::optional<model::Device> normalize(const nlohmann::json& raw);

/**
 * @brief Parses ISO-8601 UTC strings ("2024-05-01T10:00:00.250Z") or epoch
 * milliseconds. Returns std::nullopt for anything else.
 */
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const nlohmann::json& value);

}  // namespace lanmap::identity
