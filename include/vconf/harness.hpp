#pragma once

/**
 * @file harness.hpp
 * @brief From a test artifact on disk to a runnable trial
 *
 * The app is resolved from the manifest, converted to a component when it
 * is a core module, composed with the shims and the test, and optionally
 * persisted for inspection.
 */

#include "vconf/composer.hpp"
#include "vconf/config.hpp"
#include "vconf/host.hpp"
#include "vconf/result.hpp"
#include "vconf/trial.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

constexpr const char* DUMP_COMPOSITION_FILE = "composition.wasm";

struct HarnessOptions {
    std::string test_path;
    std::string app_path;       // empty: first local source in the manifest
    std::string manifest_path = DEFAULT_MANIFEST_FILE;
    Config config;
};

struct PreparedHarness {
    std::string name;           // file name of the test artifact
    std::string manifest;       // manifest text handed to the host
    std::vector<uint8_t> artifact;
};

// Path of the first declared component source; a remote (table) source is an error
Result<std::string> find_manifest_source(const std::string& manifest);

// App path from the override or the manifest, relative to the manifest directory
Result<std::string> locate_app(const std::string& manifest, const std::string& manifest_path,
                               const std::string& app_override);

Result<ShimSet> load_shims(const Config& config);

// Compose the test harness; writes composition.wasm when dumping is enabled
Result<PreparedHarness> prepare_harness(const HarnessOptions& options);

// One trial that loads the harness on `host` and calls its run export
Trial make_harness_trial(HarnessHost& host, PreparedHarness harness);

} // namespace vconf
