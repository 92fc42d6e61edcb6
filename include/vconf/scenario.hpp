#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Scenario Model
// ============================================================================

struct RequestHeader {
    std::string name;
    std::string value;
};

struct RequestTemplate {
    std::string method = "GET";
    std::string path = "/";
    std::vector<RequestHeader> headers;
    std::optional<std::string> body;
};

/**
 * @brief Header the response must (or may) carry
 *
 * An absent value matches any value. Optional headers may be missing.
 */
struct ExpectedHeader {
    std::string name;
    std::optional<std::string> value;
    bool optional = false;
};

struct ResponseTemplate {
    uint16_t status = 200;
    std::vector<ExpectedHeader> headers;
    std::optional<std::string> body;
};

struct Invocation {
    RequestTemplate request;
    ResponseTemplate response;
};

struct Scenario {
    std::vector<Invocation> invocations;
};

// ============================================================================
// Parsing
// ============================================================================

struct ScenarioParseResult {
    bool ok = false;
    std::string error;
    Scenario scenario;
};

/**
 * @brief Parse a scenario document
 *
 * Comments are allowed. Layout:
 * ```json
 * {
 *   "invocations": [{
 *     "request":  { "method": "GET", "path": "/", "headers": [{ "name": "n", "value": "v" }], "body": "..." },
 *     "response": { "status": 200, "headers": [{ "name": "n", "value": "v", "optional": false }], "body": "..." }
 *   }]
 * }
 * ```
 * `request.path` and `response.status` are required.
 */
ScenarioParseResult parse_scenario(const std::string& json_str);

} // namespace vconf
