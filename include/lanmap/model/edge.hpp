#pragma once

#include <string>
#include <string_view>

namespace lanmap::model {

enum class LinkType {
    Gateway,
    Mesh,
    Backbone,
    Infrastructure,
    Access
};

enum class EdgeStatus {
    Active,
    Inactive
};

// An inferred connection. Bandwidth, latency and utilization are synthesized
// from device kinds and the edge id, never measured.
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    LinkType link_type{LinkType::Mesh};
    int bandwidth_mbps{0};
    double latency_ms{0.0};
    double utilization_pct{0.0};
    bool derived{true};
    EdgeStatus status{EdgeStatus::Inactive};

    bool active() const { return status == EdgeStatus::Active; }
    bool touches(std::string_view device_id) const { return source == device_id || target == device_id; }
};

// Order-independent: make_edge_id(a, b) == make_edge_id(b, a).
std::string make_edge_id(std::string_view a, std::string_view b);

std::string_view to_string(LinkType type);
std::string_view to_string(EdgeStatus status);

}  // namespace lanmap::model
