#include "cancellation.hpp"
#include "errors.hpp"

#include <algorithm>
#include <thread>

namespace capi_pipeline {

namespace {
// Granularity at which sleepFor() re-checks the token.
constexpr auto kSleepSlice = std::chrono::milliseconds(10);
}

CancelToken::CancelToken()
    : mState(std::make_shared<State>()) {}

CancelToken::CancelToken(std::shared_ptr<State> state)
    : mState(std::move(state)) {}

CancelToken CancelToken::withTimeout(Clock::duration timeout) const {
    return withDeadline(Clock::now() + timeout);
}

CancelToken CancelToken::withDeadline(Clock::time_point deadline) const {
    auto child      = std::make_shared<State>();
    child->parent   = mState;
    child->deadline = deadline;
    return CancelToken(std::move(child));
}

void CancelToken::cancel() const {
    mState->cancelled.store(true);
}

bool CancelToken::flagged() const {
    for (const State* s = mState.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) return true;
    }
    return false;
}

std::optional<CancelToken::Clock::time_point> CancelToken::deadline() const {
    std::optional<Clock::time_point> tightest;
    for (const State* s = mState.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!tightest || *s->deadline < *tightest)) {
            tightest = s->deadline;
        }
    }
    return tightest;
}

std::optional<CancelToken::Clock::duration> CancelToken::remaining() const {
    const auto d = deadline();
    if (!d) return std::nullopt;
    return std::max(Clock::duration::zero(), *d - Clock::now());
}

bool CancelToken::deadlineExceeded() const {
    const auto d = deadline();
    return d && Clock::now() >= *d;
}

bool CancelToken::isCancelled() const {
    return flagged() || deadlineExceeded();
}

void CancelToken::throwIfCancelled() const {
    if (flagged()) {
        throw CancelledError(ErrorKind::Cancelled, "operation cancelled");
    }
    if (deadlineExceeded()) {
        throw CancelledError(ErrorKind::Timeout, "deadline exceeded");
    }
}

void CancelToken::sleepFor(Clock::duration d) const {
    const auto wakeAt = Clock::now() + d;
    for (;;) {
        throwIfCancelled();
        const auto now = Clock::now();
        if (now >= wakeAt) return;
        std::this_thread::sleep_for(std::min<Clock::duration>(wakeAt - now, kSleepSlice));
    }
}

} // namespace capi_pipeline
