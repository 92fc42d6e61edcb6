#pragma once

#include "vconf/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vconf {

/**
 * @brief Convert a core module into a component with an external tool
 *
 * `command` is run with `{input}` and `{output}` expanded to temporary
 * files; the output must be a component.
 */
Result<std::vector<uint8_t>> componentize(const std::vector<uint8_t>& module,
                                          const std::vector<std::string>& command);

/**
 * @brief Return a component for any app binary
 *
 * Components pass through unchanged. Core modules are converted with
 * `command`; with no command configured they are rejected.
 */
Result<std::vector<uint8_t>> ensure_component(std::vector<uint8_t> bytes,
                                              const std::vector<std::string>& command);

} // namespace vconf
