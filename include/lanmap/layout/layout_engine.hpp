#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "lanmap/model/device.hpp"
#include "lanmap/model/topology_view.hpp"

namespace lanmap::layout {

struct Bounds {
    double width{1000.0};
    double height{700.0};
    double padding{40.0};
};

/**
 * @brief Assigns 2-D coordinates to a device set.
 *
 * The full layout is recomputed on every call. Devices are ordered by id
 * before placement and the jitter generator is re-seeded per call, so the
 * same input always yields the same positions.
 */
class LayoutEngine {
public:
    static constexpr std::uint32_t kDefaultSeed = 1337;

    explicit LayoutEngine(std::uint32_t seed = kDefaultSeed);

    std::vector<model::Device> position(std::vector<model::Device> devices,
                                        model::LayoutStrategy strategy,
                                        const Bounds& bounds) const;

    std::uint32_t seed() const noexcept { return seed_; }

private:
    void place_hierarchical(std::vector<model::Device>& devices, const Bounds& bounds) const;
    void place_circular(std::vector<model::Device>& devices, const Bounds& bounds) const;
    void place_grid(std::vector<model::Device>& devices, const Bounds& bounds) const;
    void place_clustered(std::vector<model::Device>& devices, const Bounds& bounds, std::mt19937& rng) const;

    std::uint32_t seed_;
};

}  // namespace lanmap::layout
