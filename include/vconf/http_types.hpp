#pragma once

#include "vconf/http_fields.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {
namespace http {

using Body = std::vector<uint8_t>;

constexpr const char* DEFAULT_AUTHORITY = "localhost:3000";
constexpr const char* DEFAULT_PATH_WITH_QUERY = "/";
constexpr const char* DEFAULT_METHOD = "GET";

// ============================================================================
// Scheme
// ============================================================================

enum class SchemeKind {
    Http,
    Https,
    Other,
};

struct Scheme {
    SchemeKind kind = SchemeKind::Http;
    std::string other;  // set when kind == Other

    static Scheme http() { return {SchemeKind::Http, ""}; }
    static Scheme https() { return {SchemeKind::Https, ""}; }
    static Scheme custom(std::string s) { return {SchemeKind::Other, std::move(s)}; }
};

// Http and an absent scheme map to "http"
std::string scheme_to_string(const std::optional<Scheme>& scheme);

// "http"/"https" (any case) map to the named kinds, everything else to Other
Scheme scheme_from_string(const std::string& s);

// ============================================================================
// Error Codes
// ============================================================================

// Subset of wasi:http error-code a handler can report instead of a response
enum class HttpErrorCode {
    DnsError,
    ConnectionRefused,
    ConnectionTimeout,
    HttpRequestDenied,
    HttpRequestMethodInvalid,
    HttpRequestUriInvalid,
    HttpResponseIncomplete,
    HttpResponseTimeout,
    InternalError,
};

inline const char* http_error_code_to_string(HttpErrorCode code) {
    switch (code) {
        case HttpErrorCode::DnsError: return "DNS-error";
        case HttpErrorCode::ConnectionRefused: return "connection-refused";
        case HttpErrorCode::ConnectionTimeout: return "connection-timeout";
        case HttpErrorCode::HttpRequestDenied: return "HTTP-request-denied";
        case HttpErrorCode::HttpRequestMethodInvalid: return "HTTP-request-method-invalid";
        case HttpErrorCode::HttpRequestUriInvalid: return "HTTP-request-URI-invalid";
        case HttpErrorCode::HttpResponseIncomplete: return "HTTP-response-incomplete";
        case HttpErrorCode::HttpResponseTimeout: return "HTTP-response-timeout";
        case HttpErrorCode::InternalError: return "internal-error";
        default: return "internal-error";
    }
}

struct HttpError {
    HttpErrorCode code = HttpErrorCode::InternalError;
    std::string detail;

    std::string toString() const {
        std::string s = http_error_code_to_string(code);
        if (!detail.empty()) s += ": " + detail;
        return s;
    }
};

// ============================================================================
// Requests
// ============================================================================

bool is_valid_method(const std::string& method);

// Must start with '/' and contain no whitespace or control bytes
bool is_valid_path_with_query(const std::string& path);

/**
 * @brief Request under construction on the client side
 *
 * Optional parts fall back to their defaults when the request is turned
 * into an incoming request.
 */
struct OutgoingRequest {
    std::string method = DEFAULT_METHOD;
    std::optional<Scheme> scheme;
    std::optional<std::string> authority;
    std::optional<std::string> path_with_query;
    Fields headers;
    std::optional<Body> body;
};

/**
 * @brief Request as delivered to an inbound handler
 */
struct IncomingRequest {
    std::string method = DEFAULT_METHOD;
    std::string scheme = "http";
    std::string authority = DEFAULT_AUTHORITY;
    std::string path_with_query = DEFAULT_PATH_WITH_QUERY;
    Fields headers;
    std::optional<Body> body;  // empty once consumed

    std::string uri() const { return scheme + "://" + authority + path_with_query; }
};

/**
 * @brief Convert a client-side request into the handler-side request
 *
 * Fills the scheme, authority and path defaults, copies headers verbatim
 * and moves the body (an absent body becomes an explicit empty body).
 */
IncomingRequest to_incoming_request(OutgoingRequest&& request);

// ============================================================================
// Responses
// ============================================================================

struct OutgoingResponse {
    uint16_t status = 200;
    Fields headers;
    Body body;
};

// Status codes a response may carry
inline bool is_valid_status(uint32_t status) {
    return status >= 100 && status <= 999;
}

struct IncomingBody;

/**
 * @brief Response as seen by the requester
 *
 * Headers are immutable. The body can be consumed once.
 */
struct IncomingResponse {
    uint16_t status = 200;
    Fields headers;
    std::optional<Body> body;
};

IncomingResponse to_incoming_response(OutgoingResponse&& response);

struct IncomingBody {
    std::optional<Body> contents;  // empty once the stream is taken
};

struct InputStream {
    Body data;
    size_t position = 0;

    bool at_end() const { return position >= data.size(); }

    // Up to max_bytes of the remaining data; empty at end of stream
    Body blocking_read(uint64_t max_bytes);
};

} // namespace http
} // namespace vconf
