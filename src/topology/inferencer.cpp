#include "lanmap/topology/inferencer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <unordered_set>

namespace lanmap::topology {

namespace {

using model::Device;
using model::DeviceKind;
using model::Edge;
using model::LinkType;

// FNV-1a; stable across platforms so synthetic edge attributes reproduce.
std::uint64_t stable_hash(std::string_view text) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (char c : text) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool is_gateway_octet(int octet) {
    return octet == 1 || octet == 254;
}

bool by_address_then_id(const Device* a, const Device* b) {
    if (a->address != b->address) {
        return a->address < b->address;
    }
    return a->id < b->id;
}

}  // namespace

int TopologyInferencer::capacity_mbps(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Router:
        case DeviceKind::Switch:
            return 1000;
        case DeviceKind::Server:
        case DeviceKind::Workstation:
            return 100;
        case DeviceKind::Unknown:
            break;
    }
    return 10;
}

std::optional<std::array<int, 4>> TopologyInferencer::parse_ipv4(std::string_view address) {
    std::array<int, 4> octets{};
    std::size_t index = 0;
    std::size_t pos = 0;
    while (index < octets.size()) {
        std::size_t digits = 0;
        int value = 0;
        while (pos < address.size() && std::isdigit(static_cast<unsigned char>(address[pos]))) {
            value = value * 10 + (address[pos] - '0');
            ++digits;
            ++pos;
            if (digits > 3) {
                return std::nullopt;
            }
        }
        if (digits == 0 || value > 255) {
            return std::nullopt;
        }
        octets[index++] = value;
        if (index < octets.size()) {
            if (pos >= address.size() || address[pos] != '.') {
                return std::nullopt;
            }
            ++pos;
        }
    }
    if (pos != address.size()) {
        return std::nullopt;
    }
    return octets;
}

std::optional<std::string> TopologyInferencer::subnet_prefix(std::string_view address) {
    if (!parse_ipv4(address)) {
        return std::nullopt;
    }
    return std::string(address.substr(0, address.rfind('.')));
}

std::vector<Edge> TopologyInferencer::infer(const std::vector<Device>& devices) const {
    return analyze(devices).edges;
}

TopologyReport TopologyInferencer::analyze(const std::vector<Device>& devices) const {
    TopologyReport report;

    std::map<std::string, std::vector<const Device*>> groups;
    std::unordered_set<std::string> seen_ids;
    for (const auto& device : devices) {
        if (!seen_ids.insert(device.id).second) {
            continue;
        }
        auto prefix = subnet_prefix(device.address);
        if (!prefix) {
            report.excluded_ids.push_back(device.id);
            continue;
        }
        groups[*prefix].push_back(&device);
    }
    std::sort(report.excluded_ids.begin(), report.excluded_ids.end());

    std::unordered_set<std::string> emitted;
    auto emit = [&](const Device& source, const Device& target, LinkType type) {
        auto edge = make_edge(source, target, type);
        if (emitted.insert(edge.id).second) {
            report.edges.push_back(std::move(edge));
        }
    };

    for (auto& [prefix, members] : groups) {
        std::sort(members.begin(), members.end(), by_address_then_id);

        model::SubnetReport group;
        group.prefix = prefix;
        group.member_ids.reserve(members.size());
        for (const auto* member : members) {
            group.member_ids.push_back(member->id);
        }

        if (members.size() > 1) {
            if (const Device* gateway = select_gateway(members)) {
                group.gateway_id = gateway->id;
                group.resolution = model::SubnetResolution::Star;
                for (const auto* member : members) {
                    if (member != gateway) {
                        emit(*gateway, *member, LinkType::Gateway);
                    }
                }
            } else if (members.size() <= kMaxMeshGroupSize) {
                group.resolution = model::SubnetResolution::Mesh;
                for (std::size_t i = 0; i < members.size(); ++i) {
                    for (std::size_t j = i + 1; j < members.size(); ++j) {
                        emit(*members[i], *members[j], LinkType::Mesh);
                    }
                }
            } else {
                group.resolution = model::SubnetResolution::Unresolved;
            }
        }
        report.groups.push_back(std::move(group));
    }

    std::sort(report.edges.begin(), report.edges.end(), [](const Edge& a, const Edge& b) { return a.id < b.id; });
    return report;
}

const Device* TopologyInferencer::select_gateway(const std::vector<const Device*>& members) {
    const Device* best_router = nullptr;
    const Device* best_candidate = nullptr;
    for (const auto* member : members) {
        if (member->kind_or_unknown() == DeviceKind::Router) {
            if (best_router == nullptr || by_address_then_id(member, best_router)) {
                best_router = member;
            }
            continue;
        }
        auto octets = parse_ipv4(member->address);
        if (octets && is_gateway_octet((*octets)[3])) {
            if (best_candidate == nullptr || by_address_then_id(member, best_candidate)) {
                best_candidate = member;
            }
        }
    }
    return best_router != nullptr ? best_router : best_candidate;
}

Edge TopologyInferencer::make_edge(const Device& source, const Device& target, LinkType type) {
    Edge edge;
    edge.id = model::make_edge_id(source.id, target.id);
    edge.source = source.id;
    edge.target = target.id;
    edge.link_type = type;
    edge.bandwidth_mbps =
        std::min(capacity_mbps(source.kind_or_unknown()), capacity_mbps(target.kind_or_unknown()));
    edge.derived = true;
    edge.status = source.online() && target.online() ? model::EdgeStatus::Active : model::EdgeStatus::Inactive;

    const auto hash = stable_hash(edge.id);
    if (type == LinkType::Gateway) {
        edge.latency_ms = 1.0 + static_cast<double>(hash % 1000) / 100.0;
        edge.utilization_pct = static_cast<double>((hash >> 16) % 1001) / 10.0;
    } else {
        edge.latency_ms = 1.0 + static_cast<double>(hash % 500) / 100.0;
        edge.utilization_pct = static_cast<double>((hash >> 16) % 501) / 10.0;
    }
    return edge;
}

}  // namespace lanmap::topology
