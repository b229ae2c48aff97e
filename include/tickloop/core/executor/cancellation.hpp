#pragma once

#include <tickloop/core/utils/clock.hpp>
#include <atomic>
#include <memory>
#include <optional>

namespace TickLoop {

/**
 * @class CancellationToken
 * @brief Shared cancel flag with an optional deadline.
 *
 * Copies observe the same state. A default-constructed token is inert:
 * it can never be cancelled and has no deadline. Tokens are checked
 * before a handler starts; a handler that is already running is never
 * interrupted.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken create() {
        CancellationToken token;
        token.state_ = std::make_shared<State>();
        return token;
    }

    static CancellationToken withDeadline(Clock::TimePoint deadline) {
        CancellationToken token = create();
        token.state_->deadline = deadline;
        return token;
    }

    static CancellationToken withTimeout(Clock::Duration timeout) {
        return withDeadline(Clock::now() + timeout);
    }

    // No-op on an inert token
    void cancel() const {
        if (state_) {
            state_->cancelled.store(true, std::memory_order_release);
        }
    }

    bool isCancelled() const {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    bool isExpired() const {
        return state_ && state_->deadline && Clock::now() >= *state_->deadline;
    }

    bool shouldSkip() const { return isCancelled() || isExpired(); }

    bool canBeCancelled() const { return static_cast<bool>(state_); }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::TimePoint> deadline;  // set before the token is shared
    };

    std::shared_ptr<State> state_;
};

} // namespace TickLoop
