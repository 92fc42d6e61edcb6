#pragma once

#include <string>
#include <vector>

namespace vconf {

constexpr const char* DEFAULT_CONFIG_FILE = "vconf.json";
constexpr const char* DEFAULT_MANIFEST_FILE = "spin.toml";

/**
 * @brief Settings from vconf.json plus environment overrides
 *
 * Relative shim paths are resolved against the directory of the config
 * file they came from.
 */
struct Config {
    std::string virt_path;
    std::string router_path;
    std::vector<std::string> host_command;
    std::vector<std::string> componentize_command;
    std::string manifest = DEFAULT_MANIFEST_FILE;
    std::string log_level = "info";
    bool dump_composition = false;
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse vconf.json content; unknown keys are warnings, wrong types errors
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Read and parse a config file
ConfigParseResult load_config(const std::string& path);

/**
 * @brief Apply VCONF_* environment variables on top of a config
 *
 * VCONF_LOG, VCONF_DUMP_COMPOSITION (any value enables), VCONF_VIRT,
 * VCONF_ROUTER and VCONF_HOST_COMMAND (whitespace separated).
 */
void apply_env_overrides(Config& config);

// Split a command line on whitespace
std::vector<std::string> split_command(const std::string& command);

} // namespace vconf
