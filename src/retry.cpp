#include "retry.hpp"

#include <algorithm>

namespace capi_pipeline {

RetryConfig::RetryConfig()
    : RetryConfig(3, std::chrono::seconds(1), std::chrono::seconds(30),
                  {429, 500, 502, 503, 504}) {}

RetryConfig::RetryConfig(int maxRetries,
                         std::chrono::milliseconds baseDelay,
                         std::chrono::milliseconds maxDelay,
                         std::set<unsigned int> retryOnCodes)
    : mMaxRetries(std::max(0, maxRetries))
    , mBaseDelay(baseDelay)
    , mMaxDelay(std::max(baseDelay, maxDelay))
    , mRetryOnCodes(std::move(retryOnCodes)) {}

} // namespace capi_pipeline
