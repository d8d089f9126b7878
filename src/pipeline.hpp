#pragma once

#include "api_client.hpp"
#include "batch.hpp"
#include "cache_manager.hpp"
#include "circuit_breaker.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "pagination.hpp"
#include "rate_limiter.hpp"
#include "token_manager.hpp"

#include <memory>

namespace capi_pipeline {

/// A fully wired client: token manager, interceptor chain, cache, breaker,
/// metrics, batch executor and page source, built from one PipelineConfig.
///
/// Request phase order:  logging, headers, metrics, circuit breaker,
///                       rate limit, auth, cache.
/// Response phase order: metrics, circuit breaker, retry flag, cache,
///                       logging.
class Pipeline {
public:
    /// Uses its own BeastTransport.
    explicit Pipeline(const PipelineConfig& config, std::shared_ptr<Logger> logger = nullptr);

    /// Uses @p transport, which must outlive the pipeline.
    Pipeline(const PipelineConfig& config, HttpTransport& transport,
             std::shared_ptr<Logger> logger = nullptr);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    ApiClient&        client() { return *mClient; }
    BatchExecutor&    batch() { return *mBatch; }
    ResourceRegistry& resources() { return mRegistry; }
    PageSource&       pages() { return *mPages; }
    TokenManager&     tokens() { return *mTokens; }

    /// nullptr when the feature is disabled in the configuration.
    std::shared_ptr<CacheManager>     cache() const { return mCache; }
    std::shared_ptr<CircuitBreaker>   circuitBreaker() const { return mBreaker; }
    std::shared_ptr<MetricsCollector> metrics() const { return mMetrics; }
    std::shared_ptr<RateLimiter>      rateLimiter() const { return mRateLimiter; }

    const std::shared_ptr<Logger>& logger() const { return mLogger; }

private:
    std::shared_ptr<Logger>               mLogger;
    std::unique_ptr<HttpTransport>        mOwnedTransport;
    HttpTransport&                        mTransport;

    std::unique_ptr<OAuth2TokenManager>   mTokens;
    std::shared_ptr<RateLimiter>          mRateLimiter;
    std::shared_ptr<CircuitBreaker>       mBreaker;
    std::shared_ptr<MetricsCollector>     mMetrics;
    std::shared_ptr<CacheManager>         mCache;
    std::unique_ptr<ApiClient>            mClient;
    ResourceRegistry                      mRegistry;
    std::unique_ptr<BatchExecutor>        mBatch;
    std::unique_ptr<ApiPageSource>        mPages;

    Pipeline(const PipelineConfig& config, std::unique_ptr<HttpTransport> owned,
             HttpTransport* transport, std::shared_ptr<Logger> logger);

    void assemble(const PipelineConfig& config);
};

} // namespace capi_pipeline
