#include "vconf/http_bridge.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

namespace {

Error header_error(http::HeaderError e) {
    return Error(ErrorCode::HEADER_ERROR, http::header_error_to_string(e));
}

Result<void> from_header_result(const Result<void, http::HeaderError>& r) {
    if (r.isErr()) return Result<void>::err(header_error(r.error()));
    return Result<void>::ok();
}

} // namespace

// ============================================================================
// Fields
// ============================================================================

Resource<http::Fields> HttpBridge::new_fields() {
    return table_.push(http::Fields());
}

Result<Resource<http::Fields>> HttpBridge::fields_from_list(const http::FieldList& entries) {
    auto fields = http::Fields::from_list(entries);
    if (fields.isErr()) return Result<Resource<http::Fields>>::err(header_error(fields.error()));
    return Result<Resource<http::Fields>>::ok(table_.push(std::move(fields.value())));
}

Result<void> HttpBridge::fields_append(Resource<http::Fields> fields, const std::string& name,
                                       const http::FieldValue& value) {
    auto f = table_.get(fields);
    if (f.isErr()) return Result<void>::err(f.error());
    return from_header_result(f.value()->append(name, value));
}

Result<void> HttpBridge::fields_set(Resource<http::Fields> fields, const std::string& name,
                                    const std::vector<http::FieldValue>& values) {
    auto f = table_.get(fields);
    if (f.isErr()) return Result<void>::err(f.error());
    return from_header_result(f.value()->set(name, values));
}

Result<void> HttpBridge::fields_remove(Resource<http::Fields> fields, const std::string& name) {
    auto f = table_.get(fields);
    if (f.isErr()) return Result<void>::err(f.error());
    return from_header_result(f.value()->remove(name));
}

Result<std::vector<http::FieldValue>> HttpBridge::fields_get(Resource<http::Fields> fields,
                                                             const std::string& name) {
    using R = Result<std::vector<http::FieldValue>>;
    auto f = table_.get(fields);
    if (f.isErr()) return R::err(f.error());
    return R::ok(f.value()->get(name));
}

Result<bool> HttpBridge::fields_has(Resource<http::Fields> fields, const std::string& name) {
    auto f = table_.get(fields);
    if (f.isErr()) return Result<bool>::err(f.error());
    return Result<bool>::ok(f.value()->has(name));
}

Result<http::FieldList> HttpBridge::fields_entries(Resource<http::Fields> fields) {
    auto f = table_.get(fields);
    if (f.isErr()) return Result<http::FieldList>::err(f.error());
    return Result<http::FieldList>::ok(f.value()->entries());
}

// ============================================================================
// Outgoing Requests
// ============================================================================

Result<Resource<http::OutgoingRequest>> HttpBridge::new_outgoing_request(
    Resource<http::Fields> headers) {
    using R = Result<Resource<http::OutgoingRequest>>;
    auto fields = table_.take(headers);
    if (fields.isErr()) return R::err(fields.error());

    http::OutgoingRequest request;
    request.headers = std::move(fields.value());
    request.headers.make_immutable();
    return R::ok(table_.push(std::move(request)));
}

Result<void> HttpBridge::outgoing_request_set_method(Resource<http::OutgoingRequest> request,
                                                     const std::string& method) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<void>::err(r.error());
    if (!http::is_valid_method(method)) {
        return Result<void>::err(Error(ErrorCode::HEADER_ERROR, "invalid method '" + method + "'"));
    }
    r.value()->method = method;
    return Result<void>::ok();
}

Result<void> HttpBridge::outgoing_request_set_path_with_query(
    Resource<http::OutgoingRequest> request, std::optional<std::string> path) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<void>::err(r.error());
    if (path && !http::is_valid_path_with_query(*path)) {
        return Result<void>::err(Error(ErrorCode::INVALID_PATH_WITH_QUERY,
                                       "invalid path-with-query '" + *path + "'"));
    }
    r.value()->path_with_query = std::move(path);
    return Result<void>::ok();
}

Result<void> HttpBridge::outgoing_request_set_scheme(Resource<http::OutgoingRequest> request,
                                                     std::optional<http::Scheme> scheme) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<void>::err(r.error());
    r.value()->scheme = std::move(scheme);
    return Result<void>::ok();
}

Result<void> HttpBridge::outgoing_request_set_authority(Resource<http::OutgoingRequest> request,
                                                        std::optional<std::string> authority) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<void>::err(r.error());
    r.value()->authority = std::move(authority);
    return Result<void>::ok();
}

Result<void> HttpBridge::outgoing_request_write_body(Resource<http::OutgoingRequest> request,
                                                     const http::Body& chunk) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<void>::err(r.error());
    auto& body = r.value()->body;
    if (!body) body.emplace();
    body->insert(body->end(), chunk.begin(), chunk.end());
    return Result<void>::ok();
}

Result<Resource<http::IncomingRequest>> HttpBridge::new_request(
    Resource<http::OutgoingRequest> request) {
    using R = Result<Resource<http::IncomingRequest>>;
    auto outgoing = table_.take(request);
    if (outgoing.isErr()) return R::err(outgoing.error());

    http::IncomingRequest incoming = http::to_incoming_request(std::move(outgoing.value()));
    spdlog::debug("request {} {}", incoming.method, incoming.uri());
    return R::ok(table_.push(std::move(incoming)));
}

// ============================================================================
// Incoming Requests
// ============================================================================

Result<const http::IncomingRequest*> HttpBridge::incoming_request(
    Resource<http::IncomingRequest> request) {
    using R = Result<const http::IncomingRequest*>;
    auto r = table_.get(request);
    if (r.isErr()) return R::err(r.error());
    return R::ok(r.value());
}

Result<Resource<http::Fields>> HttpBridge::incoming_request_headers(
    Resource<http::IncomingRequest> request) {
    using R = Result<Resource<http::Fields>>;
    auto r = table_.get(request);
    if (r.isErr()) return R::err(r.error());
    return R::ok(table_.push(http::Fields::from_trusted(r.value()->headers.entries(), true)));
}

Result<http::Body> HttpBridge::incoming_request_consume(Resource<http::IncomingRequest> request) {
    auto r = table_.get(request);
    if (r.isErr()) return Result<http::Body>::err(r.error());
    auto& body = r.value()->body;
    if (!body) {
        return Result<http::Body>::err(Error(ErrorCode::BODY_ALREADY_CONSUMED,
                                             "request body already consumed"));
    }
    http::Body contents = std::move(*body);
    body.reset();
    return Result<http::Body>::ok(std::move(contents));
}

// ============================================================================
// Responses (handler side)
// ============================================================================

std::pair<Resource<ResponseOutparam>, Resource<FutureIncomingResponse>> HttpBridge::new_response() {
    auto channel = make_response_channel();
    auto out = table_.push(ResponseOutparam{std::move(channel.first)});
    auto rx = table_.push(FutureIncomingResponse{std::move(channel.second)});
    return {out, rx};
}

Result<Resource<http::OutgoingResponse>> HttpBridge::new_outgoing_response(
    Resource<http::Fields> headers) {
    using R = Result<Resource<http::OutgoingResponse>>;
    auto fields = table_.take(headers);
    if (fields.isErr()) return R::err(fields.error());

    http::OutgoingResponse response;
    response.headers = std::move(fields.value());
    response.headers.make_immutable();
    return R::ok(table_.push(std::move(response)));
}

Result<void> HttpBridge::outgoing_response_set_status(Resource<http::OutgoingResponse> response,
                                                      uint32_t status) {
    auto r = table_.get(response);
    if (r.isErr()) return Result<void>::err(r.error());
    if (!http::is_valid_status(status)) {
        return Result<void>::err(Error(ErrorCode::INVALID_STATUS,
                                       "invalid status code " + std::to_string(status)));
    }
    r.value()->status = static_cast<uint16_t>(status);
    return Result<void>::ok();
}

Result<void> HttpBridge::outgoing_response_write_body(Resource<http::OutgoingResponse> response,
                                                      const http::Body& chunk) {
    auto r = table_.get(response);
    if (r.isErr()) return Result<void>::err(r.error());
    r.value()->body.insert(r.value()->body.end(), chunk.begin(), chunk.end());
    return Result<void>::ok();
}

Result<void> HttpBridge::set_response(Resource<ResponseOutparam> outparam,
                                      Resource<http::OutgoingResponse> response) {
    auto pending = table_.get(outparam);
    if (pending.isErr()) return Result<void>::err(pending.error());
    auto outgoing = table_.take(response);
    if (outgoing.isErr()) return Result<void>::err(outgoing.error());
    auto out = table_.take(outparam);
    if (out.isErr()) return Result<void>::err(out.error());

    auto incoming = http::to_incoming_response(std::move(outgoing.value()));
    spdlog::debug("response {} with {} header(s)", incoming.status, incoming.headers.size());
    return out.value().sender.send(ResponseOutcome::from_response(std::move(incoming)));
}

Result<void> HttpBridge::set_response_error(Resource<ResponseOutparam> outparam,
                                            http::HttpError error) {
    auto out = table_.take(outparam);
    if (out.isErr()) return Result<void>::err(out.error());
    spdlog::debug("response error {}", error.toString());
    return out.value().sender.send(ResponseOutcome::from_error(std::move(error)));
}

Result<void> HttpBridge::drop_outparam(Resource<ResponseOutparam> outparam) {
    return table_.remove(outparam);
}

// ============================================================================
// Responses (requester side)
// ============================================================================

Result<std::optional<Resource<http::IncomingResponse>>> HttpBridge::receiver_get(
    Resource<FutureIncomingResponse> receiver) {
    using R = Result<std::optional<Resource<http::IncomingResponse>>>;
    auto rx = table_.get(receiver);
    if (rx.isErr()) return R::err(rx.error());

    PollResult polled = rx.value()->receiver.poll();
    switch (polled.state) {
        case PollState::Pending:
            return R::ok(std::nullopt);
        case PollState::ProducerDropped:
            return R::err(Error(ErrorCode::PRODUCER_DROPPED, "outparam was dropped"));
        case PollState::Ready:
            break;
    }

    if (!polled.value) {
        return R::err(Error(ErrorCode::RESPONSE_ALREADY_TAKEN, "response was already taken"));
    }
    if (polled.value->error) {
        return R::err(Error(ErrorCode::RESPONSE_ERROR, polled.value->error->toString()));
    }
    return R::ok(table_.push(std::move(*polled.value->response)));
}

Result<uint16_t> HttpBridge::response_status(Resource<http::IncomingResponse> response) {
    auto r = table_.get(response);
    if (r.isErr()) return Result<uint16_t>::err(r.error());
    return Result<uint16_t>::ok(r.value()->status);
}

Result<Resource<http::Fields>> HttpBridge::response_headers(
    Resource<http::IncomingResponse> response) {
    using R = Result<Resource<http::Fields>>;
    auto r = table_.get(response);
    if (r.isErr()) return R::err(r.error());
    return R::ok(table_.push(http::Fields::from_trusted(r.value()->headers.entries(), true)));
}

Result<Resource<http::IncomingBody>> HttpBridge::response_consume(
    Resource<http::IncomingResponse> response) {
    using R = Result<Resource<http::IncomingBody>>;
    auto r = table_.get(response);
    if (r.isErr()) return R::err(r.error());
    auto& body = r.value()->body;
    if (!body) {
        return R::err(Error(ErrorCode::BODY_ALREADY_CONSUMED, "response body already consumed"));
    }
    http::IncomingBody incoming{std::move(body)};
    body.reset();
    return R::ok(table_.push(std::move(incoming)));
}

Result<Resource<http::InputStream>> HttpBridge::body_stream(Resource<http::IncomingBody> body) {
    using R = Result<Resource<http::InputStream>>;
    auto b = table_.get(body);
    if (b.isErr()) return R::err(b.error());
    auto& contents = b.value()->contents;
    if (!contents) {
        return R::err(Error(ErrorCode::STREAM_ALREADY_TAKEN, "response body stream already consumed"));
    }
    http::InputStream stream{std::move(*contents), 0};
    contents.reset();
    return R::ok(table_.push(std::move(stream)));
}

Result<http::Body> HttpBridge::stream_blocking_read(Resource<http::InputStream> stream,
                                                    uint64_t max_bytes) {
    auto s = table_.get(stream);
    if (s.isErr()) return Result<http::Body>::err(s.error());
    return Result<http::Body>::ok(s.value()->blocking_read(max_bytes));
}

} // namespace vconf
