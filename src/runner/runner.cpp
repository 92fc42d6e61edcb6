#include "vconf/runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>
#include <map>

namespace vconf {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

InvocationResult failure(std::string message) {
    InvocationResult result;
    result.error = std::move(message);
    return result;
}

// Releases whatever resources an invocation left in the bridge table
class ResourceScope {
public:
    explicit ResourceScope(HttpBridge& bridge) : bridge_(bridge) {}
    ResourceScope(const ResourceScope&) = delete;
    ResourceScope& operator=(const ResourceScope&) = delete;

    ~ResourceScope() {
        for (auto it = drops_.rbegin(); it != drops_.rend(); ++it) (*it)();
    }

    template<typename T>
    Resource<T> track(Resource<T> handle) {
        drops_.push_back([this, handle]() {
            if (!bridge_.table().contains(handle)) return;
            auto dropped = bridge_.drop(handle);
            if (dropped.isErr()) spdlog::warn("releasing resource: {}", dropped.error().message());
        });
        return handle;
    }

private:
    HttpBridge& bridge_;
    std::vector<std::function<void()>> drops_;
};

} // namespace

bool is_valid_utf8(const http::Body& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t c = bytes[i];
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += extra + 1;
    }
    return true;
}

std::string body_text(const http::Body& body) {
    if (!is_valid_utf8(body)) return "invalid utf-8";
    return std::string(body.begin(), body.end());
}

std::string ScenarioReport::first_error() const {
    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i].ok) return "invocation " + std::to_string(i) + ": " + results[i].error;
    }
    return "";
}

// ============================================================================
// Invocation
// ============================================================================

InvocationResult InvocationRunner::run(const Invocation& invocation) {
    HttpBridge& bridge = handler_.bridge();
    ResourceScope scope(bridge);
    const auto& expected_request = invocation.request;
    const auto& expected = invocation.response;

    // Request
    auto fields = scope.track(bridge.new_fields());
    for (const auto& header : expected_request.headers) {
        http::FieldValue value(header.value.begin(), header.value.end());
        auto appended = bridge.fields_append(fields, header.name, value);
        if (appended.isErr()) {
            return failure("invalid request header '" + header.name + "': " + appended.error().message());
        }
    }

    auto outgoing = bridge.new_outgoing_request(fields);
    if (outgoing.isErr()) return failure(outgoing.error().message());
    auto request = scope.track(outgoing.value());

    auto method = bridge.outgoing_request_set_method(request, expected_request.method);
    if (method.isErr()) return failure(method.error().message());
    auto path = bridge.outgoing_request_set_path_with_query(request, expected_request.path);
    if (path.isErr()) return failure("invalid request path: " + path.error().message());
    if (expected_request.body) {
        http::Body body(expected_request.body->begin(), expected_request.body->end());
        auto written = bridge.outgoing_request_write_body(request, body);
        if (written.isErr()) return failure(written.error().message());
    }

    auto incoming = bridge.new_request(request);
    if (incoming.isErr()) return failure(incoming.error().message());
    auto incoming_request = scope.track(incoming.value());

    // Submit and wait
    auto channel = bridge.new_response();
    auto outparam = scope.track(channel.first);
    auto receiver = scope.track(channel.second);

    auto handled = handler_.handle(incoming_request, outparam);
    if (handled.isErr()) return failure("handler failed: " + handled.error().message());

    std::optional<Resource<http::IncomingResponse>> response;
    while (!response) {
        auto polled = bridge.receiver_get(receiver);
        if (polled.isErr()) return failure("no response: " + polled.error().message());
        if (polled.value()) {
            response = scope.track(*polled.value());
        } else {
            handler_.yield();
        }
    }

    // Status and body
    auto status = bridge.response_status(*response);
    if (status.isErr()) return failure(status.error().message());

    auto consumed = bridge.response_consume(*response);
    if (consumed.isErr()) return failure(consumed.error().message());
    auto stream = bridge.body_stream(scope.track(consumed.value()));
    if (stream.isErr()) return failure(stream.error().message());
    auto bytes = bridge.stream_blocking_read(scope.track(stream.value()),
                                             std::numeric_limits<uint64_t>::max());
    if (bytes.isErr()) return failure(bytes.error().message());
    std::string body = body_text(bytes.value());

    if (status.value() != expected.status) {
        return failure("request failed: expected status " + std::to_string(expected.status) +
                       ", got " + std::to_string(status.value()) + "\nbody:\n" + body);
    }

    // Headers
    auto headers = bridge.response_headers(*response);
    if (headers.isErr()) return failure(headers.error().message());
    auto entries = bridge.fields_entries(scope.track(headers.value()));
    if (entries.isErr()) return failure(entries.error().message());

    std::map<std::string, std::string> actual;
    for (const auto& [name, value] : entries.value()) {
        actual[to_lower(name)] = to_lower(std::string(value.begin(), value.end()));
    }

    for (const auto& header : expected.headers) {
        auto it = actual.find(to_lower(header.name));
        if (it == actual.end()) {
            if (header.optional) continue;
            return failure("expected header " + header.name + " not found in response");
        }
        std::string actual_value = it->second;
        actual.erase(it);
        if (header.value && to_lower(*header.value) != actual_value) {
            return failure("header " + header.name + ": expected " + quoted(to_lower(*header.value)) +
                           ", got " + quoted(actual_value));
        }
    }

    if (!actual.empty()) {
        std::string listed;
        for (const auto& [name, value] : actual) {
            if (!listed.empty()) listed += ", ";
            listed += quoted(name) + ": " + quoted(value);
        }
        return failure("unexpected headers: {" + listed + "}");
    }

    if (expected.body && *expected.body != body) {
        return failure("body mismatch: expected " + quoted(*expected.body) + ", got " + quoted(body));
    }

    InvocationResult result;
    result.ok = true;
    return result;
}

ScenarioReport InvocationRunner::run_scenario(const Scenario& scenario) {
    ScenarioReport report;
    for (size_t i = 0; i < scenario.invocations.size(); ++i) {
        const auto& invocation = scenario.invocations[i];
        auto result = run(invocation);
        if (result.ok) {
            ++report.passed;
            spdlog::debug("invocation {} {} {}: ok", i, invocation.request.method, invocation.request.path);
        } else {
            ++report.failed;
            spdlog::info("invocation {} {} {} failed: {}", i, invocation.request.method,
                         invocation.request.path, result.error);
        }
        report.results.push_back(std::move(result));
    }
    return report;
}

} // namespace vconf
