#pragma once

#include <cstdint>
#include <string>

#include "lanmap/layout/layout_engine.hpp"
#include "lanmap/model/topology_view.hpp"
#include "lanmap/transport/transport_adapter.hpp"
#include "lanmap/util/logging.hpp"

namespace lanmap::config {

struct LayoutSettings {
    model::LayoutStrategy strategy{model::LayoutStrategy::Hierarchical};
    layout::Bounds bounds{};
    std::uint32_t seed{layout::LayoutEngine::kDefaultSeed};
};

struct AppConfig {
    transport::TransportSettings transport;
    LayoutSettings layout;
    util::LoggingConfig logging;
};

// Reads a YAML file. Throws std::runtime_error naming the offending field.
AppConfig load_config(const std::string& path);

// Applies LANMAP_* environment variables on top of an already loaded config.
void apply_env_overrides(AppConfig& config);

// Throws std::runtime_error for out-of-range values.
void validate(const AppConfig& config);

}  // namespace lanmap::config
