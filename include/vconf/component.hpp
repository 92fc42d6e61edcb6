#pragma once

#include "vconf/result.hpp"
#include "vconf/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Component Binary Inspection
// ============================================================================

// True if `bytes` starts with the component-model preamble
bool is_component(const std::vector<uint8_t>& bytes);

// True if `bytes` starts with the core wasm module preamble
bool is_core_module(const std::vector<uint8_t>& bytes);

// Parse the top-level import and export declarations of a component.
//
// Only the import (id 10) and export (id 11) sections are decoded; every
// other section is skipped by its declared size. Fails with
// NOT_A_COMPONENT for core modules and MALFORMED_BINARY for anything that
// does not decode.
Result<ComponentInfo> parse_component(const std::vector<uint8_t>& bytes);

// Find a declared item by exact name
const ComponentItem* find_import(const ComponentInfo& info, const std::string& name);
const ComponentItem* find_export(const ComponentInfo& info, const std::string& name);

} // namespace vconf
