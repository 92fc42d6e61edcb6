#pragma once

/**
 * @file http_bridge.hpp
 * @brief Guest-visible HTTP resources and the operations on them
 *
 * Requests, responses, header collections, bodies and streams live in a
 * ResourceTable and are addressed by typed handles. Operations that
 * consume a resource (building an incoming request, setting a response)
 * remove it from the table; later use of its handle fails with
 * RESOURCE_NOT_FOUND.
 *
 * @example
 * ```cpp
 * vconf::HttpBridge bridge;
 * auto fields = bridge.new_fields();
 * bridge.fields_append(fields, "accept", {'*', '/', '*'});
 * auto request = bridge.new_outgoing_request(fields).value();
 * bridge.outgoing_request_set_path_with_query(request, "/hello");
 * auto incoming = bridge.new_request(request).value();
 * ```
 */

#include "vconf/http_fields.hpp"
#include "vconf/http_types.hpp"
#include "vconf/resource_table.hpp"
#include "vconf/response_channel.hpp"
#include "vconf/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace vconf {

// Handler side of a pending response
struct ResponseOutparam {
    ResponseSender sender;
};

// Requester side of a pending response
struct FutureIncomingResponse {
    ResponseReceiver receiver;
};

class HttpBridge {
public:
    HttpBridge() = default;

    ResourceTable& table() { return table_; }
    const ResourceTable& table() const { return table_; }

    // ------------------------------------------------------------------------
    // Fields
    // ------------------------------------------------------------------------

    Resource<http::Fields> new_fields();
    Result<Resource<http::Fields>> fields_from_list(const http::FieldList& entries);
    Result<void> fields_append(Resource<http::Fields> fields, const std::string& name,
                               const http::FieldValue& value);
    Result<void> fields_set(Resource<http::Fields> fields, const std::string& name,
                            const std::vector<http::FieldValue>& values);
    Result<void> fields_remove(Resource<http::Fields> fields, const std::string& name);
    Result<std::vector<http::FieldValue>> fields_get(Resource<http::Fields> fields,
                                                     const std::string& name);
    Result<bool> fields_has(Resource<http::Fields> fields, const std::string& name);
    Result<http::FieldList> fields_entries(Resource<http::Fields> fields);

    // ------------------------------------------------------------------------
    // Outgoing requests
    // ------------------------------------------------------------------------

    // Consumes the headers resource
    Result<Resource<http::OutgoingRequest>> new_outgoing_request(Resource<http::Fields> headers);
    Result<void> outgoing_request_set_method(Resource<http::OutgoingRequest> request,
                                             const std::string& method);
    Result<void> outgoing_request_set_path_with_query(Resource<http::OutgoingRequest> request,
                                                      std::optional<std::string> path);
    Result<void> outgoing_request_set_scheme(Resource<http::OutgoingRequest> request,
                                             std::optional<http::Scheme> scheme);
    Result<void> outgoing_request_set_authority(Resource<http::OutgoingRequest> request,
                                                std::optional<std::string> authority);
    Result<void> outgoing_request_write_body(Resource<http::OutgoingRequest> request,
                                             const http::Body& chunk);

    /**
     * @brief Turn an outgoing request into the request an inbound handler sees
     *
     * Consumes the outgoing request resource; its body moves with it.
     */
    Result<Resource<http::IncomingRequest>> new_request(Resource<http::OutgoingRequest> request);

    // ------------------------------------------------------------------------
    // Incoming requests (handler side)
    // ------------------------------------------------------------------------

    Result<const http::IncomingRequest*> incoming_request(Resource<http::IncomingRequest> request);
    Result<Resource<http::Fields>> incoming_request_headers(Resource<http::IncomingRequest> request);
    Result<http::Body> incoming_request_consume(Resource<http::IncomingRequest> request);

    // ------------------------------------------------------------------------
    // Responses (handler side)
    // ------------------------------------------------------------------------

    std::pair<Resource<ResponseOutparam>, Resource<FutureIncomingResponse>> new_response();

    // Consumes the headers resource
    Result<Resource<http::OutgoingResponse>> new_outgoing_response(Resource<http::Fields> headers);
    Result<void> outgoing_response_set_status(Resource<http::OutgoingResponse> response,
                                              uint32_t status);
    Result<void> outgoing_response_write_body(Resource<http::OutgoingResponse> response,
                                              const http::Body& chunk);

    // Both consume the outparam and fire the channel
    Result<void> set_response(Resource<ResponseOutparam> outparam,
                              Resource<http::OutgoingResponse> response);
    Result<void> set_response_error(Resource<ResponseOutparam> outparam, http::HttpError error);

    // Drops the producer without a response
    Result<void> drop_outparam(Resource<ResponseOutparam> outparam);

    // ------------------------------------------------------------------------
    // Responses (requester side)
    // ------------------------------------------------------------------------

    /**
     * @brief Poll a pending response
     *
     * Pending yields an empty optional. Ready yields the response once;
     * later polls fail with RESPONSE_ALREADY_TAKEN. A handler error fails
     * with RESPONSE_ERROR and a dropped outparam with PRODUCER_DROPPED.
     */
    Result<std::optional<Resource<http::IncomingResponse>>> receiver_get(
        Resource<FutureIncomingResponse> receiver);

    Result<uint16_t> response_status(Resource<http::IncomingResponse> response);

    // Immutable copy owned by the caller
    Result<Resource<http::Fields>> response_headers(Resource<http::IncomingResponse> response);

    Result<Resource<http::IncomingBody>> response_consume(Resource<http::IncomingResponse> response);
    Result<Resource<http::InputStream>> body_stream(Resource<http::IncomingBody> body);
    Result<http::Body> stream_blocking_read(Resource<http::InputStream> stream, uint64_t max_bytes);

    template<typename T>
    Result<void> drop(Resource<T> handle) {
        return table_.remove(handle);
    }

private:
    ResourceTable table_;
};

} // namespace vconf
