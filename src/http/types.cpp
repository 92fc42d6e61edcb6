#include "vconf/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace vconf {
namespace http {

std::string scheme_to_string(const std::optional<Scheme>& scheme) {
    if (!scheme) return "http";
    switch (scheme->kind) {
        case SchemeKind::Http: return "http";
        case SchemeKind::Https: return "https";
        case SchemeKind::Other: return scheme->other;
    }
    return "http";
}

Scheme scheme_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "http") return Scheme::http();
    if (lower == "https") return Scheme::https();
    return Scheme::custom(s);
}

bool is_valid_method(const std::string& method) {
    // Methods share the header-name token grammar
    return is_valid_field_name(method);
}

bool is_valid_path_with_query(const std::string& path) {
    if (path.empty() || path[0] != '/') return false;
    for (char ch : path) {
        auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7F) return false;
    }
    return true;
}

IncomingRequest to_incoming_request(OutgoingRequest&& request) {
    IncomingRequest incoming;
    incoming.method = std::move(request.method);
    incoming.scheme = scheme_to_string(request.scheme);
    incoming.authority = request.authority.value_or(DEFAULT_AUTHORITY);
    incoming.path_with_query = request.path_with_query.value_or(DEFAULT_PATH_WITH_QUERY);
    incoming.headers = Fields::from_trusted(request.headers.entries(), true);
    incoming.body = request.body ? std::move(*request.body) : Body{};
    request.body.reset();
    return incoming;
}

IncomingResponse to_incoming_response(OutgoingResponse&& response) {
    IncomingResponse incoming;
    incoming.status = response.status;
    incoming.headers = Fields::from_trusted(response.headers.entries(), true);
    incoming.body = std::move(response.body);
    return incoming;
}

Body InputStream::blocking_read(uint64_t max_bytes) {
    if (at_end()) return {};
    size_t remaining = data.size() - position;
    size_t n = remaining;
    if (max_bytes < static_cast<uint64_t>(remaining)) {
        n = static_cast<size_t>(max_bytes);
    }
    Body chunk(data.begin() + static_cast<std::ptrdiff_t>(position),
               data.begin() + static_cast<std::ptrdiff_t>(position + n));
    position += n;
    return chunk;
}

} // namespace http
} // namespace vconf
