#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace capi_pipeline {

/// Cancellation flag plus optional deadline, shared by value.
///
/// Copies refer to the same state.  withTimeout()/withDeadline() derive a
/// child that is cancelled whenever its parent is, and additionally expires
/// at its own deadline.  Cancelling a child never affects the parent.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();

    CancelToken withTimeout(Clock::duration timeout) const;
    CancelToken withDeadline(Clock::time_point deadline) const;

    void cancel() const;

    /// True once cancel() was called on this token or an ancestor, or the
    /// tightest deadline along the chain has passed.
    bool isCancelled() const;

    bool deadlineExceeded() const;

    /// Tightest deadline along the chain, if any.
    std::optional<Clock::time_point> deadline() const;

    /// Time left before the deadline (nullopt when there is none).
    std::optional<Clock::duration> remaining() const;

    /// Throws CancelledError (kind Timeout when the deadline passed,
    /// Cancelled otherwise).
    void throwIfCancelled() const;

    /// Sleep for @p d, waking early and throwing if the token is cancelled.
    void sleepFor(Clock::duration d) const;

private:
    struct State {
        std::atomic<bool>                 cancelled{false};
        std::optional<Clock::time_point>  deadline;
        std::shared_ptr<const State>      parent;
    };

    explicit CancelToken(std::shared_ptr<State> state);

    bool flagged() const;

    std::shared_ptr<State> mState;
};

} // namespace capi_pipeline
