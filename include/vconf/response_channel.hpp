#pragma once

#include "vconf/http_types.hpp"
#include "vconf/result.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace vconf {

/**
 * @brief What a handler delivered: a response or an error code
 */
struct ResponseOutcome {
    std::optional<http::IncomingResponse> response;
    std::optional<http::HttpError> error;

    static ResponseOutcome from_response(http::IncomingResponse r) {
        ResponseOutcome o;
        o.response = std::move(r);
        return o;
    }
    static ResponseOutcome from_error(http::HttpError e) {
        ResponseOutcome o;
        o.error = std::move(e);
        return o;
    }
};

enum class PollState {
    Pending,
    Ready,
    ProducerDropped,
};

inline const char* poll_state_to_string(PollState s) {
    switch (s) {
        case PollState::Pending: return "pending";
        case PollState::Ready: return "ready";
        case PollState::ProducerDropped: return "producer-dropped";
        default: return "pending";
    }
}

// value is set only on the first Ready poll
struct PollResult {
    PollState state = PollState::Pending;
    std::optional<ResponseOutcome> value;
};

namespace detail {
struct ChannelState;
}

/**
 * @brief Producing half of a response channel
 *
 * Sends at most once. Destroying a sender that never sent marks the
 * channel ProducerDropped.
 */
class ResponseSender {
public:
    explicit ResponseSender(std::shared_ptr<detail::ChannelState> state);
    ~ResponseSender();

    ResponseSender(ResponseSender&& other) noexcept;
    ResponseSender& operator=(ResponseSender&& other) noexcept;
    ResponseSender(const ResponseSender&) = delete;
    ResponseSender& operator=(const ResponseSender&) = delete;

    Result<void> send(ResponseOutcome outcome);
    bool sent() const;

private:
    void release();

    std::shared_ptr<detail::ChannelState> state_;
};

/**
 * @brief Consuming half of a response channel
 */
class ResponseReceiver {
public:
    explicit ResponseReceiver(std::shared_ptr<detail::ChannelState> state);

    // Non-blocking; safe to call again after a terminal state
    PollResult poll();

private:
    std::shared_ptr<detail::ChannelState> state_;
};

std::pair<ResponseSender, ResponseReceiver> make_response_channel();

} // namespace vconf
