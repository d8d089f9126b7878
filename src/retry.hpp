#pragma once

#include <chrono>
#include <set>

namespace capi_pipeline {

/// Retry policy.  Immutable once constructed.
class RetryConfig {
public:
    /// 3 retries, 1 s base delay, 30 s cap, codes {429, 500, 502, 503, 504}.
    RetryConfig();

    RetryConfig(int maxRetries,
                std::chrono::milliseconds baseDelay,
                std::chrono::milliseconds maxDelay,
                std::set<unsigned int> retryOnCodes);

    int maxRetries() const { return mMaxRetries; }
    std::chrono::milliseconds baseDelay() const { return mBaseDelay; }
    std::chrono::milliseconds maxDelay() const { return mMaxDelay; }
    const std::set<unsigned int>& retryOnCodes() const { return mRetryOnCodes; }

    bool isRetryable(unsigned int status) const {
        return mRetryOnCodes.count(status) != 0;
    }

private:
    int                       mMaxRetries;
    std::chrono::milliseconds mBaseDelay;
    std::chrono::milliseconds mMaxDelay;
    std::set<unsigned int>    mRetryOnCodes;
};

} // namespace capi_pipeline
