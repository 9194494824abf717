#include "lanmap/layout/layout_engine.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <string>

#include "lanmap/topology/inferencer.hpp"

namespace lanmap::layout {

namespace {

using model::Device;
using model::DeviceKind;
using model::Point;

constexpr double kPi = 3.14159265358979323846;

double usable_width(const Bounds& bounds) {
    return std::max(0.0, bounds.width - 2.0 * bounds.padding);
}

double usable_height(const Bounds& bounds) {
    return std::max(0.0, bounds.height - 2.0 * bounds.padding);
}

Point center_of(const Bounds& bounds) {
    return {bounds.width / 2.0, bounds.height / 2.0};
}

Point clamp_to(const Point& point, const Bounds& bounds) {
    const double min_x = bounds.padding;
    const double min_y = bounds.padding;
    const double max_x = std::max(min_x, bounds.width - bounds.padding);
    const double max_y = std::max(min_y, bounds.height - bounds.padding);
    return {std::clamp(point.x, min_x, max_x), std::clamp(point.y, min_y, max_y)};
}

Point on_circle(const Point& center, double radius, double angle) {
    return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
}

// Even angular spacing starting at twelve o'clock.
double slot_angle(std::size_t index, std::size_t count) {
    return 2.0 * kPi * static_cast<double>(index) / static_cast<double>(count) - kPi / 2.0;
}

std::size_t band_of(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Router:
            return 0;
        case DeviceKind::Switch:
            return 1;
        case DeviceKind::Server:
            return 2;
        case DeviceKind::Workstation:
        case DeviceKind::Unknown:
            break;
    }
    return 3;
}

bool by_address_then_id(const Device* a, const Device* b) {
    if (a->address != b->address) {
        return a->address < b->address;
    }
    return a->id < b->id;
}

}  // namespace

LayoutEngine::LayoutEngine(std::uint32_t seed) : seed_(seed) {}

std::vector<Device> LayoutEngine::position(std::vector<Device> devices,
                                           model::LayoutStrategy strategy,
                                           const Bounds& bounds) const {
    std::sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) { return a.id < b.id; });
    if (devices.empty()) {
        return devices;
    }

    std::mt19937 rng(seed_);
    switch (strategy) {
        case model::LayoutStrategy::Hierarchical:
            place_hierarchical(devices, bounds);
            break;
        case model::LayoutStrategy::Circular:
            place_circular(devices, bounds);
            break;
        case model::LayoutStrategy::Grid:
            place_grid(devices, bounds);
            break;
        case model::LayoutStrategy::Clustered:
            place_clustered(devices, bounds, rng);
            break;
    }

    for (auto& device : devices) {
        device.layout_position = clamp_to(device.layout_position.value_or(center_of(bounds)), bounds);
    }
    return devices;
}

void LayoutEngine::place_hierarchical(std::vector<Device>& devices, const Bounds& bounds) const {
    std::array<std::vector<Device*>, 4> bands;
    for (auto& device : devices) {
        bands[band_of(device.kind_or_unknown())].push_back(&device);
    }

    const auto band_count = static_cast<std::size_t>(
        std::count_if(bands.begin(), bands.end(), [](const auto& band) { return !band.empty(); }));
    const double band_height = usable_height(bounds) / static_cast<double>(band_count);
    const double width = usable_width(bounds);

    std::size_t row = 0;
    for (const auto& band : bands) {
        if (band.empty()) {
            continue;
        }
        const double y = bounds.padding + (static_cast<double>(row) + 0.5) * band_height;
        const double spacing = width / static_cast<double>(band.size());
        for (std::size_t i = 0; i < band.size(); ++i) {
            band[i]->layout_position = Point{bounds.padding + (static_cast<double>(i) + 0.5) * spacing, y};
        }
        ++row;
    }
}

void LayoutEngine::place_circular(std::vector<Device>& devices, const Bounds& bounds) const {
    const Point center = center_of(bounds);
    if (devices.size() == 1) {
        devices.front().layout_position = center;
        return;
    }
    const double radius = std::min(bounds.width, bounds.height) / 3.0;
    for (std::size_t i = 0; i < devices.size(); ++i) {
        devices[i].layout_position = on_circle(center, radius, slot_angle(i, devices.size()));
    }
}

void LayoutEngine::place_grid(std::vector<Device>& devices, const Bounds& bounds) const {
    const auto count = devices.size();
    const auto cols = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    const auto rows = (count + cols - 1) / cols;
    const double cell_w = usable_width(bounds) / static_cast<double>(cols);
    const double cell_h = usable_height(bounds) / static_cast<double>(rows);

    for (std::size_t i = 0; i < count; ++i) {
        const auto col = i % cols;
        const auto row = i / cols;
        devices[i].layout_position = Point{bounds.padding + (static_cast<double>(col) + 0.5) * cell_w,
                                           bounds.padding + (static_cast<double>(row) + 0.5) * cell_h};
    }
}

void LayoutEngine::place_clustered(std::vector<Device>& devices, const Bounds& bounds, std::mt19937& rng) const {
    const Point center = center_of(bounds);
    const double extent = std::min(bounds.width, bounds.height);
    const double inner_radius = extent / 4.0;
    const double orbit_radius = extent / 10.0;
    const double outer_radius = extent * 0.42;

    std::uniform_real_distribution<double> angle_jitter(-0.2, 0.2);
    std::uniform_real_distribution<double> radius_jitter(0.85, 1.15);

    std::vector<Device*> routers;
    for (auto& device : devices) {
        if (device.kind_or_unknown() == DeviceKind::Router) {
            routers.push_back(&device);
        }
    }
    std::sort(routers.begin(), routers.end(), by_address_then_id);

    // The first router (by address) of a subnet anchors that subnet.
    std::map<std::string, Device*> anchor_by_prefix;
    for (std::size_t i = 0; i < routers.size(); ++i) {
        routers[i]->layout_position =
            routers.size() == 1 ? center : on_circle(center, inner_radius, slot_angle(i, routers.size()));
        if (auto prefix = topology::TopologyInferencer::subnet_prefix(routers[i]->address)) {
            anchor_by_prefix.emplace(*prefix, routers[i]);
        }
    }

    std::map<const Device*, std::vector<Device*>> orbits;
    std::vector<Device*> unanchored;
    for (auto& device : devices) {
        if (device.kind_or_unknown() == DeviceKind::Router) {
            continue;
        }
        auto prefix = topology::TopologyInferencer::subnet_prefix(device.address);
        auto anchor = prefix ? anchor_by_prefix.find(*prefix) : anchor_by_prefix.end();
        if (anchor == anchor_by_prefix.end()) {
            unanchored.push_back(&device);
        } else {
            orbits[anchor->second].push_back(&device);
        }
    }

    // Iterate anchors in router order so the draw sequence is stable.
    for (const auto* router : routers) {
        auto it = orbits.find(router);
        if (it == orbits.end()) {
            continue;
        }
        const auto& members = it->second;
        const Point anchor = *router->layout_position;
        for (std::size_t i = 0; i < members.size(); ++i) {
            const double angle = slot_angle(i, members.size()) + angle_jitter(rng);
            members[i]->layout_position = on_circle(anchor, orbit_radius * radius_jitter(rng), angle);
        }
    }

    for (std::size_t i = 0; i < unanchored.size(); ++i) {
        const double angle = slot_angle(i, unanchored.size()) + angle_jitter(rng);
        unanchored[i]->layout_position = on_circle(center, outer_radius * radius_jitter(rng), angle);
    }
}

}  // namespace lanmap::layout
