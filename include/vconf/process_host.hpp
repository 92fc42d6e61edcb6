#pragma once

#include "vconf/host.hpp"

#include <map>
#include <string>
#include <vector>

namespace vconf {

constexpr const char* MANIFEST_ENV = "VCONF_MANIFEST";

struct ProcessResult {
    bool ok = false;        // process ran and was reaped
    std::string error;
    int exit_code = -1;     // 128 + signal when killed by a signal
};

/**
 * @brief Run argv[0] (looked up on PATH) with extra environment entries
 *
 * Waits for the child and reports its exit status.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& extra_env);

// Replace each `{key}` in every argument with its value
std::vector<std::string> expand_placeholders(const std::vector<std::string>& command,
                                             const std::map<std::string, std::string>& values);

/**
 * @brief HarnessHost backed by an external runtime command
 *
 * The artifact and manifest are written to temporary files. The command
 * runs with `{artifact}` expanded and VCONF_MANIFEST pointing at the
 * manifest; exit status 0 means the harness passed.
 */
class ProcessHost : public HarnessHost {
public:
    explicit ProcessHost(std::vector<std::string> command) : command_(std::move(command)) {}

    Result<std::unique_ptr<HarnessInstance>> load_harness(
        const std::vector<uint8_t>& artifact, const std::string& manifest) override;

private:
    std::vector<std::string> command_;
};

} // namespace vconf
