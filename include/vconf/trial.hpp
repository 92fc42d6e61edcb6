#pragma once

#include "vconf/result.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace vconf {

/**
 * @brief One independently reported test execution
 */
struct Trial {
    std::string name;
    std::function<Result<void>()> body;
};

struct TrialSummary {
    size_t passed = 0;
    size_t failed = 0;
    std::vector<std::string> failures;

    bool ok() const { return failed == 0; }
};

/**
 * @brief Run every trial and report in the usual test-runner layout
 *
 * Prints `test <name> ... ok|FAILED` per trial, the failure messages, then
 * a `test result:` line.
 */
TrialSummary run_trials(const std::vector<Trial>& trials, std::ostream& out);

} // namespace vconf
