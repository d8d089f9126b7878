/// @file test_cache_interceptors.cpp
/// Unit tests for cache_interceptors.hpp: cache short-circuit, conditional
/// requests, invalidation scope and the smart cache configuration.

#include "cache_interceptors.hpp"

#include <gtest/gtest.h>

#include <any>
#include <chrono>
#include <memory>
#include <thread>

using namespace capi_pipeline;
using namespace std::chrono_literals;

static Request makeRequest(const std::string& method, const std::string& path) {
    Request r;
    r.method = method;
    r.path   = path;
    return r;
}

static std::shared_ptr<CacheManager> makeManager() {
    return std::make_shared<CacheManager>(std::make_shared<MemoryCache>(100));
}

// ============================================================================
// Cache read / populate
// ============================================================================

TEST(CacheInterceptors, StoresThenServesFromCache) {
    auto manager    = makeManager();
    auto onRequest  = cacheRequestInterceptor(manager);
    auto onResponse = cacheResponseInterceptor(manager);

    Request first = makeRequest("GET", "/v3/apps");
    onRequest(CancelToken(), first);
    EXPECT_EQ(first.metadata.count(meta::kCachedBody), 0u);

    Response resp;
    resp.status = 200;
    resp.body   = R"({"resources":[]})";
    resp.headers["ETag"] = "\"e1\"";
    onResponse(CancelToken(), first, resp);

    Request second = makeRequest("GET", "/v3/apps");
    onRequest(CancelToken(), second);
    ASSERT_EQ(second.metadata.count(meta::kCachedBody), 1u);
    EXPECT_EQ(std::any_cast<std::string>(second.metadata[meta::kCachedBody]), resp.body);

    EXPECT_EQ(manager->getEntry("GET:/v3/apps")->etag, "\"e1\"");
    EXPECT_EQ(manager->getStats().hits, 1);
    EXPECT_EQ(manager->getStats().misses, 1);
}

TEST(CacheInterceptors, QueryParamsArePartOfTheKey) {
    auto manager    = makeManager();
    auto onResponse = cacheResponseInterceptor(manager);

    Request req = makeRequest("GET", "/v3/apps");
    req.query["page"] = "2";
    Response resp;
    resp.status = 200;
    resp.body   = "page two";
    onResponse(CancelToken(), req, resp);

    EXPECT_TRUE(manager->getEntry("GET:/v3/apps:page=2").has_value());
    EXPECT_FALSE(manager->getEntry("GET:/v3/apps").has_value());
}

TEST(CacheInterceptors, ErrorsAndExcludedPathsAreNotStored) {
    auto manager    = makeManager();
    auto onResponse = cacheResponseInterceptor(manager);

    Request req = makeRequest("GET", "/v3/apps/missing");
    Response notFound;
    notFound.status = 404;
    onResponse(CancelToken(), req, notFound);

    Request job = makeRequest("GET", "/v3/jobs/123");
    Response ok;
    ok.status = 200;
    onResponse(CancelToken(), job, ok);

    EXPECT_TRUE(manager->keys().empty());
}

TEST(CacheInterceptors, ResourceTtlApplies) {
    auto manager = makeManager();
    CacheTtls ttls;
    ttls.defaultTtl = 1h;
    ttls.byPrefix   = {{"/v3/tasks", 20ms}};
    auto onResponse = cacheResponseInterceptor(manager, CachingPolicy(), ttls);

    Request req = makeRequest("GET", "/v3/tasks/1");
    Response resp;
    resp.status = 200;
    onResponse(CancelToken(), req, resp);

    EXPECT_TRUE(manager->getEntry("GET:/v3/tasks/1").has_value());
    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(manager->getEntry("GET:/v3/tasks/1").has_value());
}

TEST(CacheInterceptors, MarksMisses) {
    auto manager    = makeManager();
    auto onResponse = cacheResponseInterceptor(manager, CachingPolicy(), CacheTtls(), true);

    Request req = makeRequest("GET", "/v3/apps");
    Response resp;
    resp.status = 200;
    onResponse(CancelToken(), req, resp);
    EXPECT_EQ(resp.header(kCacheStatusHeader), "MISS");
}

// ============================================================================
// Conditional requests
// ============================================================================

TEST(ConditionalRequest, AddsIfNoneMatchForGetOnly) {
    auto manager = makeManager();
    manager->setWithETag(CacheManager::getCacheKey("GET", "/v3/apps/123"), "data", "abc123", 1h);
    auto interceptor = conditionalRequestInterceptor(manager);

    Request get = makeRequest("GET", "/v3/apps/123");
    interceptor(CancelToken(), get);
    EXPECT_EQ(get.header("If-None-Match"), "abc123");

    Request post = makeRequest("POST", "/v3/apps");
    interceptor(CancelToken(), post);
    EXPECT_EQ(post.header("If-None-Match"), "");
}

TEST(ConditionalRequest, NotModifiedServesCachedBody) {
    auto manager = makeManager();
    manager->setWithETag("GET:/v3/apps/123", "cached-app", "abc123", 1h);
    auto interceptor = conditionalResponseInterceptor(manager);

    Request req = makeRequest("GET", "/v3/apps/123");
    Response resp;
    resp.status = 304;
    interceptor(CancelToken(), req, resp);

    EXPECT_EQ(resp.status, 200u);
    EXPECT_EQ(resp.body, "cached-app");
    EXPECT_EQ(resp.header("ETag"), "abc123");
    EXPECT_EQ(resp.header(kCacheStatusHeader), "REVALIDATED");
}

TEST(ConditionalRequest, NotModifiedWithoutEntryIsLeftAlone) {
    auto manager = makeManager();
    auto interceptor = conditionalResponseInterceptor(manager);

    Request req = makeRequest("GET", "/v3/apps/999");
    Response resp;
    resp.status = 304;
    interceptor(CancelToken(), req, resp);
    EXPECT_EQ(resp.status, 304u);
}

// ============================================================================
// Invalidation
// ============================================================================

TEST(CacheInvalidation, MutationInvalidatesPathParentAndChildren) {
    auto manager = makeManager();
    manager->set("GET:/v3/apps/123", "app", 1h);
    manager->set("GET:/v3/apps/123/env", "env", 1h);
    manager->set("GET:/v3/apps", "list", 1h);
    manager->set("GET:/v3/apps:page=2", "list p2", 1h);
    manager->set("GET:/v3/apps/456", "other app", 1h);
    manager->set("GET:/v3/spaces", "spaces", 1h);

    auto interceptor = cacheInvalidationInterceptor(manager);
    Request req = makeRequest("PUT", "/v3/apps/123");
    Response resp;
    resp.status = 200;
    interceptor(CancelToken(), req, resp);

    EXPECT_FALSE(manager->getEntry("GET:/v3/apps/123").has_value());
    EXPECT_FALSE(manager->getEntry("GET:/v3/apps/123/env").has_value());
    EXPECT_FALSE(manager->getEntry("GET:/v3/apps").has_value());
    EXPECT_FALSE(manager->getEntry("GET:/v3/apps:page=2").has_value());
    EXPECT_TRUE(manager->getEntry("GET:/v3/apps/456").has_value());
    EXPECT_TRUE(manager->getEntry("GET:/v3/spaces").has_value());
}

TEST(CacheInvalidation, FailedMutationKeepsEntries) {
    auto manager = makeManager();
    manager->set("GET:/v3/apps/456", "app", 1h);

    auto interceptor = cacheInvalidationInterceptor(manager);
    Request req = makeRequest("DELETE", "/v3/apps/456");
    Response resp;
    resp.status = 404;
    interceptor(CancelToken(), req, resp);

    EXPECT_TRUE(manager->getEntry("GET:/v3/apps/456").has_value());
}

TEST(CacheInvalidation, ReadsNeverInvalidate) {
    auto manager = makeManager();
    manager->set("GET:/v3/apps", "list", 1h);

    auto interceptor = cacheInvalidationInterceptor(manager);
    Request req = makeRequest("GET", "/v3/apps");
    Response resp;
    resp.status = 200;
    interceptor(CancelToken(), req, resp);

    EXPECT_TRUE(manager->getEntry("GET:/v3/apps").has_value());
}

TEST(CacheKeyPath, ExtractsPath) {
    EXPECT_EQ(cacheKeyPath("GET:/v3/apps"), "/v3/apps");
    EXPECT_EQ(cacheKeyPath("GET:/v3/apps:page=1&per_page=50"), "/v3/apps");
    EXPECT_EQ(cacheKeyPath("garbage"), "");
}

// ============================================================================
// Smart configuration
// ============================================================================

TEST(SmartCacheConfig, Defaults) {
    auto config = defaultSmartCacheConfig();
    EXPECT_TRUE(config.enableSmartInvalidation);
    EXPECT_TRUE(config.enableConditionalRequests);
    EXPECT_TRUE(config.enableMetrics);
    EXPECT_FALSE(config.ttls.byPrefix.empty());
    EXPECT_EQ(config.ttls.byPrefix.at("/v3/organizations"), std::chrono::minutes(10));
    EXPECT_EQ(config.ttls.ttlFor("/v3/spaces/1"), std::chrono::minutes(5));
    EXPECT_EQ(config.ttls.ttlFor("/v3/apps"), std::chrono::minutes(2));
    EXPECT_EQ(config.ttls.ttlFor("/v3/tasks/9"), std::chrono::seconds(30));
    EXPECT_EQ(config.ttls.ttlFor("/v3/routes"), std::chrono::minutes(5));
}

TEST(SmartCacheConfig, ConfigureRegistersInterceptors) {
    InterceptorChain chain;
    auto manager = makeManager();
    configureSmartCache(chain, manager, defaultSmartCacheConfig());

    EXPECT_EQ(chain.requestInterceptorCount(), 2u);
    EXPECT_EQ(chain.responseInterceptorCount(), 3u);

    Request req = makeRequest("GET", "/v3/apps");
    EXPECT_NO_THROW(chain.executeRequestInterceptors(CancelToken(), req));
}

TEST(SmartCacheConfig, FeaturesCanBeTurnedOff) {
    InterceptorChain chain;
    auto config = defaultSmartCacheConfig();
    config.enableConditionalRequests = false;
    config.enableSmartInvalidation   = false;
    configureSmartCache(chain, makeManager(), config);

    EXPECT_EQ(chain.requestInterceptorCount(), 1u);
    EXPECT_EQ(chain.responseInterceptorCount(), 1u);
}
