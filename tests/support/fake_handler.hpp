#pragma once

#include <vconf/http_bridge.hpp>
#include <vconf/runner.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vconf::testing {

/**
 * @brief Scripted inbound handler for runner tests
 *
 * Replies with a fixed response and records every request it sees.
 */
class FakeHandler : public IncomingHandler {
public:
    enum class Mode {
        Immediate,  // set the outparam inside handle()
        Deferred,   // set the outparam from yield() after defer_polls calls
        Drop,       // drop the outparam without a response
        Error,      // report an HTTP error code
        Trap,       // fail handle() itself
    };

    struct Reply {
        uint32_t status = 200;
        http::FieldList headers;
        std::string body;
    };

    struct SeenRequest {
        std::string method;
        std::string path_with_query;
        http::FieldList headers;
        std::string body;
    };

    Mode mode = Mode::Immediate;
    Reply reply;
    int defer_polls = 3;
    std::vector<SeenRequest> seen;
    int yields = 0;

    HttpBridge& bridge() override { return bridge_; }

    Result<void> handle(Resource<http::IncomingRequest> request,
                        Resource<ResponseOutparam> outparam) override {
        auto incoming = bridge_.incoming_request(request);
        if (incoming.isErr()) return Result<void>::err(incoming.error());

        SeenRequest record;
        record.method = incoming.value()->method;
        record.path_with_query = incoming.value()->path_with_query;
        record.headers = incoming.value()->headers.entries();
        auto body = bridge_.incoming_request_consume(request);
        if (body.isErr()) return Result<void>::err(body.error());
        record.body.assign(body.value().begin(), body.value().end());
        seen.push_back(std::move(record));

        switch (mode) {
            case Mode::Immediate:
                return respond(outparam);
            case Mode::Deferred:
                pending_ = outparam;
                return Result<void>::ok();
            case Mode::Drop:
                return bridge_.drop_outparam(outparam);
            case Mode::Error:
                return bridge_.set_response_error(
                    outparam, {http::HttpErrorCode::InternalError, "scripted failure"});
            case Mode::Trap:
                return Result<void>::err(Error(ErrorCode::HOST_FAILED, "wasm trap: unreachable"));
        }
        return Result<void>::ok();
    }

    void yield() override {
        ++yields;
        if (!pending_ || yields < defer_polls) return;
        auto outparam = *pending_;
        pending_.reset();
        auto responded = respond(outparam);
        if (responded.isErr()) last_error = responded.error().message();
    }

    std::string last_error;

private:
    Result<void> respond(Resource<ResponseOutparam> outparam) {
        auto fields = bridge_.fields_from_list(reply.headers);
        if (fields.isErr()) return Result<void>::err(fields.error());
        auto response = bridge_.new_outgoing_response(fields.value());
        if (response.isErr()) return Result<void>::err(response.error());
        auto status = bridge_.outgoing_response_set_status(response.value(), reply.status);
        if (status.isErr()) return status;
        http::Body body(reply.body.begin(), reply.body.end());
        auto written = bridge_.outgoing_response_write_body(response.value(), body);
        if (written.isErr()) return written;
        return bridge_.set_response(outparam, response.value());
    }

    HttpBridge bridge_;
    std::optional<Resource<ResponseOutparam>> pending_;
};

inline http::FieldValue field_bytes(const std::string& s) {
    return http::FieldValue(s.begin(), s.end());
}

} // namespace vconf::testing
