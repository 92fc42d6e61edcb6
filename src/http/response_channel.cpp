#include "vconf/response_channel.hpp"

#include <mutex>

namespace vconf {

namespace detail {

struct ChannelState {
    std::mutex mutex;
    bool sent = false;
    bool dropped = false;
    bool taken = false;
    std::optional<ResponseOutcome> slot;
};

} // namespace detail

// ============================================================================
// Sender
// ============================================================================

ResponseSender::ResponseSender(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state)) {}

ResponseSender::~ResponseSender() {
    release();
}

ResponseSender::ResponseSender(ResponseSender&& other) noexcept
    : state_(std::move(other.state_)) {}

ResponseSender& ResponseSender::operator=(ResponseSender&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

void ResponseSender::release() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->sent) state_->dropped = true;
    state_.reset();
}

Result<void> ResponseSender::send(ResponseOutcome outcome) {
    if (!state_) {
        return Result<void>::err(Error(ErrorCode::RESPONSE_ALREADY_SENT, "response sender was released"));
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->sent) {
        return Result<void>::err(Error(ErrorCode::RESPONSE_ALREADY_SENT, "response was already sent"));
    }
    state_->sent = true;
    state_->slot = std::move(outcome);
    return Result<void>::ok();
}

bool ResponseSender::sent() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sent;
}

// ============================================================================
// Receiver
// ============================================================================

ResponseReceiver::ResponseReceiver(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state)) {}

PollResult ResponseReceiver::poll() {
    PollResult result;
    if (!state_) {
        result.state = PollState::ProducerDropped;
        return result;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->sent) {
        result.state = PollState::Ready;
        if (!state_->taken) {
            state_->taken = true;
            result.value = std::move(state_->slot);
            state_->slot.reset();
        }
        return result;
    }
    result.state = state_->dropped ? PollState::ProducerDropped : PollState::Pending;
    return result;
}

std::pair<ResponseSender, ResponseReceiver> make_response_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {ResponseSender(state), ResponseReceiver(state)};
}

} // namespace vconf
