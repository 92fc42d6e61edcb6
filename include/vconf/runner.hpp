#pragma once

#include "vconf/http_bridge.hpp"
#include "vconf/result.hpp"
#include "vconf/scenario.hpp"

#include <string>
#include <thread>
#include <vector>

namespace vconf {

/**
 * @brief Entry point that serves requests built on its bridge
 *
 * handle() may complete the outparam before returning or later; the
 * runner calls yield() between polls so a deferred handler can make
 * progress.
 */
class IncomingHandler {
public:
    virtual ~IncomingHandler() = default;

    virtual HttpBridge& bridge() = 0;

    virtual Result<void> handle(Resource<http::IncomingRequest> request,
                                Resource<ResponseOutparam> outparam) = 0;

    virtual void yield() { std::this_thread::yield(); }
};

struct InvocationResult {
    bool ok = false;
    std::string error;
};

struct ScenarioReport {
    std::vector<InvocationResult> results;
    size_t passed = 0;
    size_t failed = 0;

    bool ok() const { return failed == 0; }

    // First failure, prefixed with its invocation index
    std::string first_error() const;
};

/**
 * @brief Drives invocations through an IncomingHandler and checks the responses
 *
 * One invocation is in flight at a time. Every resource an invocation
 * creates is released before run() returns.
 */
class InvocationRunner {
public:
    explicit InvocationRunner(IncomingHandler& handler) : handler_(handler) {}

    InvocationResult run(const Invocation& invocation);

    // Runs every invocation; a failure does not stop later invocations
    ScenarioReport run_scenario(const Scenario& scenario);

private:
    IncomingHandler& handler_;
};

// Decoded body text; invalid UTF-8 becomes the literal "invalid utf-8"
std::string body_text(const http::Body& body);

bool is_valid_utf8(const http::Body& bytes);

} // namespace vconf
