#include "circuit_breaker.hpp"
#include "errors.hpp"

namespace capi_pipeline {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : mConfig(config) {}

void CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mMutex);

    if (mState != State::Open) return;

    if (Clock::now() - mLastFailure > mConfig.timeout) {
        mState     = State::HalfOpen;
        mSuccesses = 0;
        return;
    }
    throw CircuitOpenError();
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mMutex);

    ++mFailures;
    mLastFailure = Clock::now();

    if (mFailures >= mConfig.threshold || mState == State::HalfOpen) {
        mState = State::Open;
    }
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mMutex);

    switch (mState) {
        case State::HalfOpen:
            ++mSuccesses;
            if (mSuccesses >= mConfig.successThreshold) {
                mState    = State::Closed;
                mFailures = 0;
            }
            break;
        case State::Closed:
            mFailures = 0;
            break;
        case State::Open:
            break;
    }
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mState;
}

int CircuitBreaker::failureCount() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mFailures;
}

int CircuitBreaker::successCount() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSuccesses;
}

const char* circuitStateName(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed:   return "closed";
        case CircuitBreaker::State::Open:     return "open";
        case CircuitBreaker::State::HalfOpen: return "half-open";
    }
    return "unknown";
}

RequestInterceptor circuitBreakerRequestInterceptor(std::shared_ptr<CircuitBreaker> breaker) {
    return [breaker = std::move(breaker)](const CancelToken&, Request&) {
        breaker->allowRequest();
    };
}

ResponseInterceptor circuitBreakerResponseInterceptor(std::shared_ptr<CircuitBreaker> breaker) {
    return [breaker = std::move(breaker)](const CancelToken&, const Request&,
                                          Response& response) {
        if (response.error || response.status >= 500) {
            breaker->recordFailure();
        } else {
            breaker->recordSuccess();
        }
    };
}

} // namespace capi_pipeline
