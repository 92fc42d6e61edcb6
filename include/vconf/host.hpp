#pragma once

/**
 * @file host.hpp
 * @brief Interfaces to the component-model runtime that executes artifacts
 *
 * vconf composes artifacts but does not execute them. An execution host
 * loads a composed artifact, links it against the platform and exposes
 * its entry point through one of these interfaces.
 */

#include "vconf/result.hpp"
#include "vconf/runner.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Test Harness Execution
// ============================================================================

// Loaded harness artifact; run() invokes its `run` export
class HarnessInstance {
public:
    virtual ~HarnessInstance() = default;
    virtual Result<void> run() = 0;
};

class HarnessHost {
public:
    virtual ~HarnessHost() = default;

    /**
     * @brief Load a composed test harness
     * @param artifact Encoded composition from compose_test_harness
     * @param manifest Application manifest text made available to the shim
     */
    virtual Result<std::unique_ptr<HarnessInstance>> load_harness(
        const std::vector<uint8_t>& artifact, const std::string& manifest) = 0;
};

// ============================================================================
// Virtualized App Execution
// ============================================================================

// Loaded virtualized app; serves requests built on its bridge
class AppInstance : public IncomingHandler {};

class AppHost {
public:
    virtual ~AppHost() = default;

    // Load an artifact produced by virtualize_app
    virtual Result<std::unique_ptr<AppInstance>> load_app(
        const std::vector<uint8_t>& artifact, const std::string& manifest) = 0;
};

} // namespace vconf
