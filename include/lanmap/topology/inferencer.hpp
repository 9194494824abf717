#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanmap/model/device.hpp"
#include "lanmap/model/edge.hpp"
#include "lanmap/model/topology_view.hpp"

namespace lanmap::topology {

struct TopologyReport {
    std::vector<model::Edge> edges;
    std::vector<model::SubnetReport> groups;
    // Devices without a well-formed IPv4 address; they get no edges.
    std::vector<std::string> excluded_ids;
};

/**
 * @brief Synthesizes a connectivity graph from address structure.
 *
 * Devices are grouped by the first three octets of their address. Inside a
 * group the gateway is a router-kind device, or a device whose last octet is
 * 1 or 254; routers win, ties go to the lexicographically smallest address.
 * A gateway gets a star of gateway links. Gateway-less groups of up to
 * kMaxMeshGroupSize devices get a full mesh; larger ones get no edges.
 *
 * Results depend only on the device set, never on input order.
 */
class TopologyInferencer {
public:
    static constexpr std::size_t kMaxMeshGroupSize = 4;

    std::vector<model::Edge> infer(const std::vector<model::Device>& devices) const;
    TopologyReport analyze(const std::vector<model::Device>& devices) const;

    static int capacity_mbps(model::DeviceKind kind);
    static std::optional<std::array<int, 4>> parse_ipv4(std::string_view address);
    // "10.0.0" for "10.0.0.7"; nullopt for malformed addresses.
    static std::optional<std::string> subnet_prefix(std::string_view address);

private:
    static const model::Device* select_gateway(const std::vector<const model::Device*>& members);
    static model::Edge make_edge(const model::Device& source, const model::Device& target, model::LinkType type);
};

}  // namespace lanmap::topology
