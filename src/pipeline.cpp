#include "pipeline.hpp"
#include "cache_interceptors.hpp"
#include "interceptors.hpp"

namespace capi_pipeline {

namespace {
std::unique_ptr<HttpTransport> makeBeastTransport(const PipelineConfig& config) {
    auto transport = std::make_unique<BeastTransport>(config.timeout, config.userAgent);
    transport->setVerbose(config.verbose);
    transport->setSkipTlsVerify(config.skipTlsVerify);
    return transport;
}
} // namespace

Pipeline::Pipeline(const PipelineConfig& config, std::shared_ptr<Logger> logger)
    : Pipeline(config, makeBeastTransport(config), nullptr, std::move(logger)) {}

Pipeline::Pipeline(const PipelineConfig& config, HttpTransport& transport,
                   std::shared_ptr<Logger> logger)
    : Pipeline(config, nullptr, &transport, std::move(logger)) {}

Pipeline::Pipeline(const PipelineConfig& config, std::unique_ptr<HttpTransport> owned,
                   HttpTransport* transport, std::shared_ptr<Logger> logger)
    : mLogger(logger ? std::move(logger) : std::make_shared<StderrLogger>(config.logLevel))
    , mOwnedTransport(std::move(owned))
    , mTransport(transport ? *transport : *mOwnedTransport)
{
    assemble(config);
}

void Pipeline::assemble(const PipelineConfig& config) {
    Credentials creds = config.credentials;
    creds.tokenUrl    = config.tokenUrl();
    mTokens = std::make_unique<OAuth2TokenManager>(std::move(creds), mTransport, mLogger);

    ClientOptions options;
    options.baseUrl        = config.apiUrl;
    options.userAgent      = config.userAgent;
    options.timeout        = config.timeout;
    options.retry          = config.retry;
    options.enableRetry    = config.enableRetry;
    options.tokenManager   = config.credentials.noAuth ? nullptr : mTokens.get();
    options.logger         = mLogger;
    mClient = std::make_unique<ApiClient>(mTransport, std::move(options));

    InterceptorChain& chain = mClient->interceptors();

    // --- request phase ---
    chain.addRequestInterceptor(loggingInterceptor(mLogger));
    if (!config.headers.empty()) {
        chain.addRequestInterceptor(headerInterceptor(config.headers));
    }
    if (config.enableMetrics) {
        mMetrics = std::make_shared<MetricsCollector>();
        chain.addRequestInterceptor(metricsRequestInterceptor());
    }
    if (config.enableCircuitBreaker) {
        mBreaker = std::make_shared<CircuitBreaker>(config.circuitBreaker);
        chain.addRequestInterceptor(circuitBreakerRequestInterceptor(mBreaker));
    }
    if (config.rateLimit > 0) {
        mRateLimiter = std::make_shared<RateLimiter>(config.rateLimit);
        chain.addRequestInterceptor(rateLimitInterceptor(mRateLimiter));
    }
    OAuth2TokenManager* tokens = mTokens.get();
    chain.addRequestInterceptor(authenticationInterceptor(
        [tokens](const CancelToken& cancel) { return tokens->getToken(cancel); }));

    // --- response phase ---
    if (mMetrics) {
        chain.addResponseInterceptor(metricsResponseInterceptor(mMetrics));
    }
    if (mBreaker) {
        chain.addResponseInterceptor(circuitBreakerResponseInterceptor(mBreaker));
    }
    chain.addResponseInterceptor(retryResponseInterceptor(config.retry));

    // The cache registers on both phases; its request half runs last.
    if (config.enableCache) {
        mCache = std::make_shared<CacheManager>(
            makeCache(config.cache), CacheManagerOptions{config.smartCache.ttls.defaultTtl});
        configureSmartCache(chain, mCache, config.smartCache);
    }
    chain.addResponseInterceptor(loggingResponseInterceptor(mLogger));

    registerDefaultResources(mRegistry, *mClient);
    mBatch = std::make_unique<BatchExecutor>(mRegistry, config.batchConcurrency, mLogger);
    mBatch->setTimeout(config.batchTimeout);
    mPages = std::make_unique<ApiPageSource>(*mClient);

    mLogger->debug("Pipeline assembled",
                   {{"api_url", config.apiUrl},
                    {"grant", grantTypeName(selectGrant(mTokens->credentials(), ""))},
                    {"cache", config.enableCache ? "on" : "off"},
                    {"rate_limit", std::to_string(config.rateLimit)}});
}

} // namespace capi_pipeline
