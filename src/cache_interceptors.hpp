#pragma once

#include "cache_manager.hpp"
#include "interceptors.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace capi_pipeline {

/// Per-resource cache lifetimes, looked up by longest matching path prefix.
struct CacheTtls {
    std::chrono::milliseconds                        defaultTtl{std::chrono::minutes(5)};
    std::map<std::string, std::chrono::milliseconds> byPrefix;

    std::chrono::milliseconds ttlFor(const std::string& path) const;
};

struct SmartCacheConfig {
    bool enableSmartInvalidation   = true;
    bool enableConditionalRequests = true;
    /// Stamp "X-Cache: MISS" on cacheable responses fetched from the network.
    bool enableMetrics             = true;
    /// Serve fresh hits without I/O.  When off every GET goes out, with
    /// If-None-Match when an ETag is on record.
    bool serveFromCache            = true;

    CachingPolicy policy;
    CacheTtls     ttls;
};

/// Organizations 10 min, spaces 5 min, apps 2 min, tasks 30 s, else 5 min.
SmartCacheConfig defaultSmartCacheConfig();

/// Request phase: a fresh hit for a cacheable GET is placed in
/// meta::kCachedBody so ApiClient answers without touching the transport.
RequestInterceptor cacheRequestInterceptor(std::shared_ptr<CacheManager> manager,
                                           CachingPolicy policy = CachingPolicy());

/// Response phase: stores cacheable responses together with their ETag.
ResponseInterceptor cacheResponseInterceptor(std::shared_ptr<CacheManager> manager,
                                             CachingPolicy policy = CachingPolicy(),
                                             CacheTtls ttls = CacheTtls(),
                                             bool markMisses = false);

/// Adds If-None-Match to GETs whose cached entry carries an ETag.
RequestInterceptor conditionalRequestInterceptor(std::shared_ptr<CacheManager> manager);

/// Turns a 304 for a GET with a cached entry into a 200 carrying the
/// cached payload.
ResponseInterceptor conditionalResponseInterceptor(std::shared_ptr<CacheManager> manager);

/// After a successful POST/PUT/PATCH/DELETE, removes cached entries whose
/// path equals the mutated path, is its parent collection, or lies beneath
/// it.
ResponseInterceptor cacheInvalidationInterceptor(std::shared_ptr<CacheManager> manager);

/// Registers the cache, conditional-request and invalidation interceptors
/// on @p chain according to @p config.
void configureSmartCache(InterceptorChain& chain, std::shared_ptr<CacheManager> manager,
                         const SmartCacheConfig& config = defaultSmartCacheConfig());

/// Path component of a cache key ("GET:/v3/apps:page=1" -> "/v3/apps").
std::string cacheKeyPath(const std::string& key);

} // namespace capi_pipeline
