#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanmap/model/device.hpp"
#include "lanmap/model/edge.hpp"

namespace lanmap::model {

struct AggregateCounters {
    std::size_t total{0};
    std::size_t online{0};
    std::size_t offline{0};
    std::size_t active_edges{0};

    bool operator==(const AggregateCounters& other) const {
        return total == other.total && online == other.online && offline == other.offline &&
               active_edges == other.active_edges;
    }
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    // Reconnect attempts exhausted; only a manual reconnect leaves this state.
    Failed
};

struct ConnectionStatus {
    ConnectionState state{ConnectionState::Disconnected};
    int reconnect_attempts{0};
    bool pull_in_flight{false};
    bool pull_healthy{true};
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_pull;
};

enum class LayoutStrategy {
    Hierarchical,
    Circular,
    Grid,
    Clustered
};

enum class SubnetResolution {
    Singleton,
    Star,
    Mesh,
    Unresolved
};

struct SubnetReport {
    std::string prefix;
    std::vector<std::string> member_ids;
    std::optional<std::string> gateway_id;
    SubnetResolution resolution{SubnetResolution::Singleton};
};

struct ViewFilter {
    std::optional<DeviceStatus> status;
    std::optional<DeviceKind> kind;
};

struct FilteredStats {
    std::size_t visible{0};
    std::size_t total{0};
    std::size_t online{0};
    std::size_t offline{0};
    std::size_t connections{0};
};

struct TopologyView {
    std::vector<Device> devices;
    std::vector<Edge> edges;
    std::vector<SubnetReport> groups;
    AggregateCounters counters{};
    ConnectionStatus connection{};
    LayoutStrategy strategy{LayoutStrategy::Hierarchical};
    std::uint64_t revision{0};

    const Device* find_device(std::string_view id) const;
    FilteredStats filtered_stats(const ViewFilter& filter) const;
};

std::string_view to_string(ConnectionState state);
std::string_view to_string(LayoutStrategy strategy);
std::string_view to_string(SubnetResolution resolution);

// Case-insensitive; "force" and "force-directed" select Clustered.
std::optional<LayoutStrategy> parse_layout_strategy(std::string_view text);

}  // namespace lanmap::model
