#include "vconf/scenario.hpp"

#include <nlohmann/json.hpp>

namespace vconf {

namespace {

// Parse failures inside the tree walk carry their JSON location
struct ScenarioError {
    std::string message;
};

std::string require_string(const nlohmann::json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) throw ScenarioError{where + "." + key + " missing"};
    if (!j[key].is_string()) throw ScenarioError{where + "." + key + " must be a string"};
    return j[key].get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& j, const std::string& key,
                                           const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) throw ScenarioError{where + "." + key + " must be a string"};
    return j[key].get<std::string>();
}

const nlohmann::json& require_object(const nlohmann::json& j, const std::string& key,
                                     const std::string& where) {
    if (!j.contains(key)) throw ScenarioError{where + "." + key + " missing"};
    if (!j[key].is_object()) throw ScenarioError{where + "." + key + " must be an object"};
    return j[key];
}

RequestTemplate parse_request(const nlohmann::json& j, const std::string& where) {
    RequestTemplate request;
    if (auto method = optional_string(j, "method", where)) request.method = *method;
    request.path = require_string(j, "path", where);
    request.body = optional_string(j, "body", where);

    if (j.contains("headers")) {
        if (!j["headers"].is_array()) throw ScenarioError{where + ".headers must be an array"};
        size_t i = 0;
        for (const auto& h : j["headers"]) {
            std::string at = where + ".headers[" + std::to_string(i++) + "]";
            if (!h.is_object()) throw ScenarioError{at + " must be an object"};
            request.headers.push_back({require_string(h, "name", at), require_string(h, "value", at)});
        }
    }
    return request;
}

ResponseTemplate parse_response(const nlohmann::json& j, const std::string& where) {
    ResponseTemplate response;
    if (!j.contains("status")) throw ScenarioError{where + ".status missing"};
    if (!j["status"].is_number_unsigned()) throw ScenarioError{where + ".status must be a status code"};
    auto status = j["status"].get<uint64_t>();
    if (status < 100 || status > 999) {
        throw ScenarioError{where + ".status out of range: " + std::to_string(status)};
    }
    response.status = static_cast<uint16_t>(status);
    response.body = optional_string(j, "body", where);

    if (j.contains("headers")) {
        if (!j["headers"].is_array()) throw ScenarioError{where + ".headers must be an array"};
        size_t i = 0;
        for (const auto& h : j["headers"]) {
            std::string at = where + ".headers[" + std::to_string(i++) + "]";
            if (!h.is_object()) throw ScenarioError{at + " must be an object"};
            ExpectedHeader expected;
            expected.name = require_string(h, "name", at);
            expected.value = optional_string(h, "value", at);
            if (h.contains("optional")) {
                if (!h["optional"].is_boolean()) throw ScenarioError{at + ".optional must be a boolean"};
                expected.optional = h["optional"].get<bool>();
            }
            response.headers.push_back(std::move(expected));
        }
    }
    return response;
}

} // namespace

ScenarioParseResult parse_scenario(const std::string& json_str) {
    ScenarioParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str, nullptr, true, true);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        if (!j.contains("invocations") || !j["invocations"].is_array()) {
            result.error = "invocations missing or not an array";
            return result;
        }

        size_t i = 0;
        for (const auto& inv : j["invocations"]) {
            std::string where = "invocations[" + std::to_string(i++) + "]";
            if (!inv.is_object()) throw ScenarioError{where + " must be an object"};
            Invocation invocation;
            invocation.request = parse_request(require_object(inv, "request", where), where + ".request");
            invocation.response = parse_response(require_object(inv, "response", where), where + ".response");
            result.scenario.invocations.push_back(std::move(invocation));
        }

        result.ok = true;
        return result;

    } catch (const ScenarioError& e) {
        result.error = e.message;
        return result;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace vconf
