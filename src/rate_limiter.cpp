#include "rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>

namespace capi_pipeline {

namespace {
// Upper bound on how long acquire() sleeps before re-checking its token.
constexpr auto kCancelPoll = std::chrono::milliseconds(10);
}

RateLimiter::RateLimiter(int requestsPerSecond)
    : mCapacity(requestsPerSecond)
    , mInterval(requestsPerSecond > 0
                    ? std::chrono::nanoseconds(std::chrono::seconds(1)) / requestsPerSecond
                    : std::chrono::nanoseconds(0))
    , mPermits(requestsPerSecond)
{
    if (requestsPerSecond <= 0) {
        throw std::invalid_argument("RateLimiter requires requestsPerSecond > 0");
    }
    mRefiller = std::thread(&RateLimiter::refillLoop, this);
}

RateLimiter::~RateLimiter() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mStopping = true;
    }
    mStopRequested.notify_all();
    mRefiller.join();
}

void RateLimiter::refillLoop() {
    std::unique_lock<std::mutex> lock(mMutex);
    auto next = std::chrono::steady_clock::now() + mInterval;
    while (!mStopping) {
        if (mStopRequested.wait_until(lock, next, [this] { return mStopping; })) {
            break;
        }
        if (mPermits < mCapacity) {
            ++mPermits;
            mPermitAvailable.notify_one();
        }
        next += mInterval;
    }
}

void RateLimiter::acquire(const CancelToken& cancel) {
    std::unique_lock<std::mutex> lock(mMutex);
    while (mPermits == 0) {
        cancel.throwIfCancelled();
        mPermitAvailable.wait_for(lock, kCancelPoll);
    }
    --mPermits;
}

bool RateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mPermits == 0) return false;
    --mPermits;
    return true;
}

int RateLimiter::available() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPermits;
}

RequestInterceptor rateLimitInterceptor(std::shared_ptr<RateLimiter> limiter) {
    return [limiter = std::move(limiter)](const CancelToken& cancel, Request&) {
        limiter->acquire(cancel);
    };
}

} // namespace capi_pipeline
