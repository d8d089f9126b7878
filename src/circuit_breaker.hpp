#pragma once

#include "interceptors.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace capi_pipeline {

struct CircuitBreakerConfig {
    int                       threshold        = 5;                          // failures before opening
    std::chrono::milliseconds timeout          = std::chrono::seconds(30);   // open -> half-open delay
    int                       successThreshold = 2;                          // half-open successes to close
};

/// Closed / open / half-open breaker guarding one endpoint group.
///
///   closed    --failures >= threshold-->            open
///   open      --timeout elapsed since last failure--> half-open
///   half-open --successes >= successThreshold-->    closed
///   half-open --any failure-->                      open
///
/// While closed, a success resets the failure count.  All state changes
/// happen under the breaker's mutex.
class CircuitBreaker {
public:
    enum class State { Closed, Open, HalfOpen };

    explicit CircuitBreaker(CircuitBreakerConfig config = CircuitBreakerConfig());

    /// Throws CircuitOpenError while open and the timeout has not elapsed;
    /// moves to half-open once it has.
    void allowRequest();

    void recordSuccess();
    void recordFailure();

    State state() const;
    int failureCount() const;
    int successCount() const;

    const CircuitBreakerConfig& config() const { return mConfig; }

private:
    using Clock = std::chrono::steady_clock;

    const CircuitBreakerConfig mConfig;

    mutable std::mutex mMutex;
    State              mState     = State::Closed;
    int                mFailures  = 0;
    int                mSuccesses = 0;
    Clock::time_point  mLastFailure{};
};

const char* circuitStateName(CircuitBreaker::State state);

/// Rejects requests while the breaker is open.
RequestInterceptor circuitBreakerRequestInterceptor(std::shared_ptr<CircuitBreaker> breaker);

/// Feeds the outcome back: a transport error or status >= 500 is a failure.
ResponseInterceptor circuitBreakerResponseInterceptor(std::shared_ptr<CircuitBreaker> breaker);

} // namespace capi_pipeline
