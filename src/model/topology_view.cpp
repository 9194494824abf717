#include "lanmap/model/topology_view.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace lanmap::model {

const Device* TopologyView::find_device(std::string_view id) const {
    auto it = std::find_if(devices.begin(), devices.end(), [id](const Device& d) { return d.id == id; });
    if (it == devices.end()) {
        return nullptr;
    }
    return &*it;
}

FilteredStats TopologyView::filtered_stats(const ViewFilter& filter) const {
    FilteredStats stats;
    stats.total = devices.size();

    std::unordered_set<std::string> visible_ids;
    for (const auto& device : devices) {
        if (filter.status && device.status_or_unknown() != *filter.status) {
            continue;
        }
        if (filter.kind && device.kind_or_unknown() != *filter.kind) {
            continue;
        }
        visible_ids.insert(device.id);
        ++stats.visible;
        if (device.status == DeviceStatus::Online) {
            ++stats.online;
        } else if (device.status == DeviceStatus::Offline) {
            ++stats.offline;
        }
    }

    for (const auto& edge : edges) {
        if (visible_ids.count(edge.source) != 0 && visible_ids.count(edge.target) != 0) {
            ++stats.connections;
        }
    }
    return stats;
}

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Failed:
            return "failed";
    }
    return "disconnected";
}

std::string_view to_string(LayoutStrategy strategy) {
    switch (strategy) {
        case LayoutStrategy::Hierarchical:
            return "hierarchical";
        case LayoutStrategy::Circular:
            return "circular";
        case LayoutStrategy::Grid:
            return "grid";
        case LayoutStrategy::Clustered:
            return "clustered";
    }
    return "hierarchical";
}

std::string_view to_string(SubnetResolution resolution) {
    switch (resolution) {
        case SubnetResolution::Singleton:
            return "singleton";
        case SubnetResolution::Star:
            return "star";
        case SubnetResolution::Mesh:
            return "mesh";
        case SubnetResolution::Unresolved:
            return "unresolved";
    }
    return "singleton";
}

std::optional<LayoutStrategy> parse_layout_strategy(std::string_view text) {
    std::string value;
    value.reserve(text.size());
    for (char c : text) {
        value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (value == "hierarchical") {
        return LayoutStrategy::Hierarchical;
    }
    if (value == "circular") {
        return LayoutStrategy::Circular;
    }
    if (value == "grid") {
        return LayoutStrategy::Grid;
    }
    if (value == "clustered" || value == "force" || value == "force-directed") {
        return LayoutStrategy::Clustered;
    }
    return std::nullopt;
}

}  // namespace lanmap::model
