#pragma once

#include "vconf/graph.hpp"
#include "vconf/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Well-Known Names
// ============================================================================

namespace names {

constexpr const char* INCOMING_HANDLER = "wasi:http/incoming-handler@0.2.0";
constexpr const char* OUTGOING_HANDLER = "wasi:http/outgoing-handler@0.2.0";
constexpr const char* HTTP_TYPES = "wasi:http/types@0.2.0";
constexpr const char* IO_STREAMS = "wasi:io/streams@0.2.0";
constexpr const char* HTTP_HELPER = "fermyon:spin-wasi-virt/http-helper";
constexpr const char* SET_COMPONENT_ID = "set-component-id";
constexpr const char* RUN = "run";

} // namespace names

// ============================================================================
// Capability Wiring Tables
// ============================================================================

// Node of the fixed topology that provides an export
enum class Provider {
    Shim,
    App,
    Router,
};

inline const char* provider_to_string(Provider p) {
    switch (p) {
        case Provider::Shim: return "virt";
        case Provider::App: return "app";
        case Provider::Router: return "router";
        default: return "unknown";
    }
}

// One (import name, provider, provider export) row. Rows whose export the
// provider lacks are fatal unless `required` is false.
struct CapabilityWiring {
    std::string name;
    Provider provider = Provider::Shim;
    std::string export_name;
    bool required = true;
};

// Platform capabilities the app-under-test may import from the shim
const std::vector<CapabilityWiring>& app_capabilities();

// Imports of the router
const std::vector<CapabilityWiring>& router_wiring();

// Imports of the test harness
const std::vector<CapabilityWiring>& harness_wiring();

// Public exports of a virtualized app besides its inbound handler
const std::vector<CapabilityWiring>& virtualized_app_exports();

// ============================================================================
// Composition
// ============================================================================

// Prebuilt components the fixed topologies are built from
struct ShimSet {
    std::vector<uint8_t> virt;
    std::vector<uint8_t> router;
};

/**
 * @brief Compose app + shim + router + test harness into one artifact
 *
 * The harness `run` export becomes the artifact's entry point. Apps that
 * import only a subset of the capability table still link.
 */
Result<std::vector<uint8_t>> compose_test_harness(const ShimSet& shims,
                                                  std::vector<uint8_t> app,
                                                  std::vector<uint8_t> test);

/**
 * @brief Compose app + shim + router without a test harness
 *
 * The router's inbound handler becomes the entry point; the shim's HTTP
 * types, streams and helper exports are published when present.
 */
Result<std::vector<uint8_t>> virtualize_app(const ShimSet& shims, std::vector<uint8_t> app);

} // namespace vconf
