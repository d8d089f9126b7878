#pragma once

#include "cancellation.hpp"
#include "interceptors.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace capi_pipeline {

/// Token bucket holding up to N permits, refilled one permit every 1/N s
/// by a background thread.  The bucket starts full.
class RateLimiter {
public:
    explicit RateLimiter(int requestsPerSecond);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Block until a permit is available.  Throws CancelledError if the
    /// token fires first.
    void acquire(const CancelToken& cancel);

    /// Take a permit if one is available right now.
    bool tryAcquire();

    int available() const;
    int capacity() const { return mCapacity; }

private:
    const int                 mCapacity;
    const std::chrono::nanoseconds mInterval;

    mutable std::mutex        mMutex;
    std::condition_variable   mPermitAvailable;
    std::condition_variable   mStopRequested;
    int                       mPermits;
    bool                      mStopping = false;
    std::thread               mRefiller;

    void refillLoop();
};

/// Request interceptor that takes one permit per request.
RequestInterceptor rateLimitInterceptor(std::shared_ptr<RateLimiter> limiter);

} // namespace capi_pipeline
