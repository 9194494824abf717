#include "lanmap/util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lanmap::util {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "warning") {
        return spdlog::level::warn;
    }
    if (lowered == "error") {
        return spdlog::level::err;
    }
    const auto level = spdlog::level::from_str(lowered);
    // from_str() maps unknown names to off.
    if (level == spdlog::level::off && lowered != "off") {
        return std::nullopt;
    }
    return level;
}

void configure_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
    }

    auto logger = std::make_shared<spdlog::logger>("lanmap", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }

    auto level = parse_log_level(config.level);
    spdlog::set_level(level.value_or(spdlog::level::info));
    if (!level) {
        spdlog::warn("Unknown log level '{}', using info", config.level);
    }
}

namespace log {

void debug(const std::string& message) {
    spdlog::debug(message);
}

void info(const std::string& message) {
    spdlog::info(message);
}

void warn(const std::string& message) {
    spdlog::warn(message);
}

void error(const std::string& message) {
    spdlog::error(message);
}

}  // namespace log

}  // namespace lanmap::util
