#include "cache_interceptors.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace capi_pipeline {

namespace {

bool isMutation(const std::string& method) {
    const std::string verb = toUpper(method);
    return verb == "POST" || verb == "PUT" || verb == "PATCH" || verb == "DELETE";
}

bool isGet(const Request& request) {
    return toUpper(request.method) == "GET";
}

std::string parentCollection(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "";
    return path.substr(0, slash);
}

} // namespace

std::chrono::milliseconds CacheTtls::ttlFor(const std::string& path) const {
    std::chrono::milliseconds ttl = defaultTtl;
    std::size_t bestLength = 0;
    for (const auto& [prefix, value] : byPrefix) {
        if (prefix.size() > bestLength && pathHasPrefix(path, prefix)) {
            ttl        = value;
            bestLength = prefix.size();
        }
    }
    return ttl;
}

SmartCacheConfig defaultSmartCacheConfig() {
    using namespace std::chrono;

    SmartCacheConfig config;
    config.ttls.defaultTtl = minutes(5);
    config.ttls.byPrefix   = {
        {"/v3/organizations", minutes(10)},
        {"/v3/spaces",        minutes(5)},
        {"/v3/apps",          minutes(2)},
        {"/v3/tasks",         seconds(30)},
    };
    return config;
}

std::string cacheKeyPath(const std::string& key) {
    auto first = key.find(':');
    if (first == std::string::npos) return "";
    auto second = key.find(':', first + 1);
    return key.substr(first + 1, second == std::string::npos ? std::string::npos
                                                              : second - first - 1);
}

// ---------------------------------------------------------------------------
// Cache read / populate
// ---------------------------------------------------------------------------

RequestInterceptor cacheRequestInterceptor(std::shared_ptr<CacheManager> manager,
                                           CachingPolicy policy) {
    return [manager = std::move(manager), policy = std::move(policy)](const CancelToken&,
                                                                      Request& request) {
        if (!isGet(request) || !policy.allowsRequest(request.method, request.path)) return;

        const std::string key = CacheManager::getCacheKey(request.method, request.path, request.query);
        try {
            request.metadata[meta::kCachedBody] = manager->get(key);
        } catch (const CacheError&) {
            // miss: go to the network
        }
    };
}

ResponseInterceptor cacheResponseInterceptor(std::shared_ptr<CacheManager> manager,
                                             CachingPolicy policy, CacheTtls ttls,
                                             bool markMisses) {
    return [manager = std::move(manager), policy = std::move(policy), ttls = std::move(ttls),
            markMisses](const CancelToken&, const Request& request, Response& response) {
        if (response.error) return;
        if (response.header(kCacheStatusHeader) == "HIT") return;
        if (!policy.shouldCache(request.method, request.path, response.status)) return;

        const std::string key = CacheManager::getCacheKey(request.method, request.path, request.query);
        manager->setWithETag(key, response.body, response.header("ETag"), ttls.ttlFor(request.path));

        if (markMisses && response.header(kCacheStatusHeader).empty()) {
            response.headers[kCacheStatusHeader] = "MISS";
        }
    };
}

// ---------------------------------------------------------------------------
// Conditional requests
// ---------------------------------------------------------------------------

RequestInterceptor conditionalRequestInterceptor(std::shared_ptr<CacheManager> manager) {
    return [manager = std::move(manager)](const CancelToken&, Request& request) {
        if (!isGet(request) || request.metadata.count(meta::kCachedBody)) return;
        if (!request.header("If-None-Match").empty()) return;

        auto entry = manager->getEntry(
            CacheManager::getCacheKey(request.method, request.path, request.query));
        if (entry && !entry->etag.empty()) {
            request.headers["If-None-Match"] = entry->etag;
        }
    };
}

ResponseInterceptor conditionalResponseInterceptor(std::shared_ptr<CacheManager> manager) {
    return [manager = std::move(manager)](const CancelToken&, const Request& request,
                                          Response& response) {
        if (response.error || response.status != 304 || !isGet(request)) return;

        auto entry = manager->getEntry(
            CacheManager::getCacheKey(request.method, request.path, request.query));
        if (!entry) return;

        response.status = 200;
        response.body   = entry->data;
        if (response.header("ETag").empty() && !entry->etag.empty()) {
            response.headers["ETag"] = entry->etag;
        }
        response.headers[kCacheStatusHeader] = "REVALIDATED";
    };
}

// ---------------------------------------------------------------------------
// Invalidation
// ---------------------------------------------------------------------------

ResponseInterceptor cacheInvalidationInterceptor(std::shared_ptr<CacheManager> manager) {
    return [manager = std::move(manager)](const CancelToken&, const Request& request,
                                          Response& response) {
        if (response.error || response.status < 200 || response.status >= 300) return;
        if (!isMutation(request.method)) return;

        const std::string parent = parentCollection(request.path);
        for (const auto& key : manager->keys()) {
            const std::string path = cacheKeyPath(key);
            if (pathHasPrefix(path, request.path) || (!parent.empty() && path == parent)) {
                manager->remove(key);
            }
        }
    };
}

void configureSmartCache(InterceptorChain& chain, std::shared_ptr<CacheManager> manager,
                         const SmartCacheConfig& config) {
    if (config.serveFromCache) {
        chain.addRequestInterceptor(cacheRequestInterceptor(manager, config.policy));
    }
    if (config.enableConditionalRequests) {
        chain.addRequestInterceptor(conditionalRequestInterceptor(manager));
        chain.addResponseInterceptor(conditionalResponseInterceptor(manager));
    }
    chain.addResponseInterceptor(
        cacheResponseInterceptor(manager, config.policy, config.ttls, config.enableMetrics));
    if (config.enableSmartInvalidation) {
        chain.addResponseInterceptor(cacheInvalidationInterceptor(manager));
    }
}

} // namespace capi_pipeline
