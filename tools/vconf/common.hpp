/**
 * vconf CLI - Common utilities and types
 */

#pragma once

#include <vconf/config.hpp>
#include <vconf/harness.hpp>
#include <vconf/log.hpp>
#include <vconf/platform.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace vconf::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string app;               // --app
    std::string manifest;          // --manifest
    std::string config;            // --config
    std::string virt;              // --virt
    std::string router;            // --router
    std::string host_command;      // --host-command
    bool verbose = false;          // -v, --verbose
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

inline void print_warning(const std::string& msg) {
    std::cerr << "Warning: " << msg << std::endl;
}

/**
 * Resolve settings.
 * Priority: command-line flags > VCONF_* env > config file > defaults.
 * An explicit --config must exist; ./vconf.json is used when present.
 */
inline std::optional<Config> load_settings(const GlobalOptions& opts) {
    Config config;

    std::string config_path = opts.config;
    if (config_path.empty() && path_exists(DEFAULT_CONFIG_FILE)) {
        config_path = DEFAULT_CONFIG_FILE;
    }

    if (!config_path.empty()) {
        auto parsed = load_config(config_path);
        if (!parsed.ok) {
            print_error(config_path + ": " + parsed.error);
            return std::nullopt;
        }
        for (const auto& warning : parsed.warnings) {
            print_warning(config_path + ": " + warning);
        }
        config = parsed.config;
    }

    apply_env_overrides(config);

    if (!opts.manifest.empty()) config.manifest = opts.manifest;
    if (!opts.virt.empty()) config.virt_path = opts.virt;
    if (!opts.router.empty()) config.router_path = opts.router;
    if (!opts.host_command.empty()) config.host_command = split_command(opts.host_command);
    if (opts.verbose) config.log_level = "debug";

    if (!init_logging(config.log_level)) {
        print_warning("unknown log level '" + config.log_level + "', using info");
    }
    return config;
}

inline HarnessOptions harness_options(const GlobalOptions& opts, const Config& config,
                                      const std::string& test_path) {
    HarnessOptions options;
    options.test_path = test_path;
    options.app_path = opts.app;
    options.manifest_path = config.manifest;
    options.config = config;
    return options;
}

} // namespace vconf::cli
