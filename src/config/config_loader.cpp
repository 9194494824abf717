#include "lanmap/config/config_loader.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace lanmap::config {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Field '" + field + "' has an invalid value");
    }
}

template <typename T>
T scalar_or(const YAML::Node& node, const std::string& field, const T& fallback) {
    if (!node) {
        return fallback;
    }
    return scalar_or_throw<T>(node, field);
}

std::chrono::milliseconds millis_or(const YAML::Node& node,
                                    const std::string& field,
                                    std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds{scalar_or<long long>(node, field, fallback.count())};
}

long long parse_integer(const std::string& text, const std::string& name) {
    long long value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::runtime_error("Environment variable " + name + " must be an integer, got '" + text + "'");
    }
    return value;
}

YAML::Node section(const YAML::Node& root, const std::string& name, bool required) {
    auto node = root[name];
    if (!node) {
        if (required) {
            throw std::runtime_error("Config must contain a '" + name + "' section");
        }
        return node;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("Section '" + name + "' must be a mapping");
    }
    return node;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0' ? value : nullptr;
}

void override_string(const char* name, std::string& target) {
    if (const char* value = env(name)) {
        target = value;
    }
}

}  // namespace

AppConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
        if (!root.IsMap()) {
            throw std::runtime_error("Config '" + path + "' must be a YAML mapping");
        }
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to load config '" + path + "': " + ex.what());
    }

    AppConfig config;

    const auto push = section(root, "push", true);
    auto& push_settings = config.transport.push;
    push_settings.host = scalar_or_throw<std::string>(push["host"], "push.host");
    push_settings.port = scalar_or<std::string>(push["port"], "push.port", push_settings.port);
    push_settings.endpoint = scalar_or<std::string>(push["endpoint"], "push.endpoint", push_settings.endpoint);
    if (const auto reconnect = section(push, "reconnect", false); reconnect) {
        push_settings.max_attempts =
            scalar_or<int>(reconnect["max_attempts"], "push.reconnect.max_attempts", push_settings.max_attempts);
        push_settings.initial_delay = millis_or(
            reconnect["initial_delay_ms"], "push.reconnect.initial_delay_ms", push_settings.initial_delay);
        push_settings.max_delay =
            millis_or(reconnect["max_delay_ms"], "push.reconnect.max_delay_ms", push_settings.max_delay);
    }

    const auto pull = section(root, "pull", true);
    auto& pull_settings = config.transport.pull;
    pull_settings.host = scalar_or_throw<std::string>(pull["host"], "pull.host");
    pull_settings.port = scalar_or<std::string>(pull["port"], "pull.port", pull_settings.port);
    pull_settings.target = scalar_or<std::string>(pull["target"], "pull.target", pull_settings.target);
    pull_settings.interval = millis_or(pull["interval_ms"], "pull.interval_ms", pull_settings.interval);
    pull_settings.timeout = millis_or(pull["timeout_ms"], "pull.timeout_ms", pull_settings.timeout);
    pull_settings.auth_token = scalar_or<std::string>(pull["auth_token"], "pull.auth_token", pull_settings.auth_token);

    if (const auto layout = section(root, "layout", false); layout) {
        auto& settings = config.layout;
        if (layout["strategy"]) {
            const auto name = scalar_or_throw<std::string>(layout["strategy"], "layout.strategy");
            auto strategy = model::parse_layout_strategy(name);
            if (!strategy) {
                throw std::runtime_error("Field 'layout.strategy' has unknown value '" + name + "'");
            }
            settings.strategy = *strategy;
        }
        settings.bounds.width = scalar_or<double>(layout["width"], "layout.width", settings.bounds.width);
        settings.bounds.height = scalar_or<double>(layout["height"], "layout.height", settings.bounds.height);
        settings.bounds.padding = scalar_or<double>(layout["padding"], "layout.padding", settings.bounds.padding);
        settings.seed = scalar_or<std::uint32_t>(layout["seed"], "layout.seed", settings.seed);
    }

    if (const auto logging = section(root, "logging", false); logging) {
        config.logging.level = scalar_or<std::string>(logging["level"], "logging.level", config.logging.level);
        config.logging.pattern = scalar_or<std::string>(logging["pattern"], "logging.pattern", config.logging.pattern);
        config.logging.file = scalar_or<std::string>(logging["file"], "logging.file", config.logging.file);
    }

    validate(config);
    return config;
}

void apply_env_overrides(AppConfig& config) {
    auto& push = config.transport.push;
    auto& pull = config.transport.pull;

    override_string("LANMAP_PUSH_HOST", push.host);
    override_string("LANMAP_PUSH_PORT", push.port);
    override_string("LANMAP_PUSH_ENDPOINT", push.endpoint);
    override_string("LANMAP_PULL_HOST", pull.host);
    override_string("LANMAP_PULL_PORT", pull.port);
    override_string("LANMAP_PULL_TARGET", pull.target);
    override_string("LANMAP_AUTH_TOKEN", pull.auth_token);
    override_string("LANMAP_LOG_LEVEL", config.logging.level);

    if (const char* value = env("LANMAP_PULL_INTERVAL_MS")) {
        pull.interval = std::chrono::milliseconds{parse_integer(value, "LANMAP_PULL_INTERVAL_MS")};
    }
    if (const char* value = env("LANMAP_RECONNECT_MAX_ATTEMPTS")) {
        push.max_attempts = static_cast<int>(parse_integer(value, "LANMAP_RECONNECT_MAX_ATTEMPTS"));
    }

    validate(config);
}

void validate(const AppConfig& config) {
    const auto& push = config.transport.push;
    const auto& pull = config.transport.pull;
    const auto& bounds = config.layout.bounds;

    if (push.host.empty()) {
        throw std::runtime_error("Field 'push.host' must not be empty");
    }
    if (pull.host.empty()) {
        throw std::runtime_error("Field 'pull.host' must not be empty");
    }
    if (push.max_attempts <= 0) {
        throw std::runtime_error("Field 'push.reconnect.max_attempts' must be positive");
    }
    if (push.initial_delay.count() <= 0) {
        throw std::runtime_error("Field 'push.reconnect.initial_delay_ms' must be positive");
    }
    if (push.max_delay < push.initial_delay) {
        throw std::runtime_error("Field 'push.reconnect.max_delay_ms' must not be below initial_delay_ms");
    }
    if (pull.interval.count() <= 0) {
        throw std::runtime_error("Field 'pull.interval_ms' must be positive");
    }
    if (pull.timeout.count() <= 0) {
        throw std::runtime_error("Field 'pull.timeout_ms' must be positive");
    }
    if (bounds.width <= 0.0 || bounds.height <= 0.0) {
        throw std::runtime_error("Fields 'layout.width' and 'layout.height' must be positive");
    }
    if (bounds.padding < 0.0 || bounds.padding * 2.0 >= bounds.width || bounds.padding * 2.0 >= bounds.height) {
        throw std::runtime_error("Field 'layout.padding' must be smaller than half of each dimension");
    }
}

}  // namespace lanmap::config
