/// @file test_rate_limiter.cpp
/// Unit tests for rate_limiter.hpp: token bucket refill, blocking acquire
/// and cancellation.

#include "errors.hpp"
#include "rate_limiter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace capi_pipeline;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST(RateLimiter, RejectsNonPositiveRate) {
    EXPECT_THROW(RateLimiter(0), std::invalid_argument);
    EXPECT_THROW(RateLimiter(-3), std::invalid_argument);
}

TEST(RateLimiter, StartsFull) {
    RateLimiter limiter(5);
    EXPECT_EQ(limiter.capacity(), 5);
    EXPECT_EQ(limiter.available(), 5);
}

TEST(RateLimiter, BurstUpToCapacityThenEmpty) {
    RateLimiter limiter(3);
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_FALSE(limiter.tryAcquire());
}

TEST(RateLimiter, RefillsOverTime) {
    RateLimiter limiter(20);   // one permit every 50 ms
    while (limiter.tryAcquire()) {}

    std::this_thread::sleep_for(180ms);
    EXPECT_GE(limiter.available(), 2);
    EXPECT_LE(limiter.available(), 4);
}

TEST(RateLimiter, NeverExceedsCapacity) {
    RateLimiter limiter(10);
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(limiter.available(), 10);
}

TEST(RateLimiter, AcquireBlocksUntilRefill) {
    RateLimiter limiter(10);   // 100 ms per permit
    while (limiter.tryAcquire()) {}

    const auto start = Clock::now();
    limiter.acquire(CancelToken());
    const auto waited = Clock::now() - start;

    EXPECT_GE(waited, 30ms);
    EXPECT_LT(waited, 1s);
}

TEST(RateLimiter, AcquireHonorsDeadline) {
    RateLimiter limiter(1);    // 1 s per permit
    ASSERT_TRUE(limiter.tryAcquire());

    const auto cancel = CancelToken().withTimeout(50ms);
    const auto start  = Clock::now();
    try {
        limiter.acquire(cancel);
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
    EXPECT_LT(Clock::now() - start, 500ms);
}

TEST(RateLimiter, AcquireHonorsCancel) {
    RateLimiter limiter(1);
    ASSERT_TRUE(limiter.tryAcquire());

    CancelToken cancel;
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(30ms);
        cancel.cancel();
    });

    try {
        limiter.acquire(cancel);
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    canceller.join();
}

TEST(RateLimitInterceptor, TakesOnePermitPerRequest) {
    auto limiter = std::make_shared<RateLimiter>(2);
    auto interceptor = rateLimitInterceptor(limiter);

    Request req;
    interceptor(CancelToken(), req);
    EXPECT_EQ(limiter->available(), 1);
    interceptor(CancelToken(), req);
    EXPECT_EQ(limiter->available(), 0);
}
