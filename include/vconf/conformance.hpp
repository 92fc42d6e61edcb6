#pragma once

#include "vconf/composer.hpp"
#include "vconf/host.hpp"
#include "vconf/result.hpp"
#include "vconf/scenario.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vconf {

constexpr const char* FIXTURE_MANIFEST = "spin.toml";
constexpr const char* FIXTURE_COMPONENT = "component.wasm";
constexpr const char* FIXTURE_SCENARIO = "test.json";

/**
 * @brief One conformance test: an app, its manifest and the expected exchanges
 */
struct Fixture {
    std::string name;
    std::string manifest;
    std::vector<uint8_t> component;
    Scenario scenario;
};

// Load spin.toml, component.wasm and test.json from a fixture directory
Result<Fixture> load_fixture(const std::string& dir);

/**
 * @brief Virtualize the fixture app, load it and run its scenario
 *
 * Fails with ASSERTION_FAILED naming the first failing invocation when
 * any invocation fails.
 */
Result<void> run_conformance_test(AppHost& host, const ShimSet& shims, const Fixture& fixture);

} // namespace vconf
