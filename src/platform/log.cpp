#include "vconf/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace vconf {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

bool init_logging(const std::string& level) {
    // Trial output goes to stdout; logs stay on stderr
    static auto logger = [] {
        auto l = spdlog::stderr_color_mt("vconf");
        l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(l);
        return l;
    }();

    auto parsed = parse_log_level(level);
    if (!parsed) {
        spdlog::set_level(spdlog::level::info);
        return false;
    }
    spdlog::set_level(*parsed);
    return true;
}

} // namespace vconf
