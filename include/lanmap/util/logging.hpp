#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace lanmap::util {

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern;
    std::string file;
};

// Case-insensitive spdlog level name ("trace" .. "off", also "warning").
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Installs the default logger: colour console sink plus an optional file sink.
void configure_logging(const LoggingConfig& config);

namespace log {

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace log

}  // namespace lanmap::util
