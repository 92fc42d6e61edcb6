#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace vconf {

// trace|debug|info|warn|error|off (also "warning", "critical")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Configure the default logger; false when the level name is unknown
bool init_logging(const std::string& level);

} // namespace vconf
