/// @file test_api_client.cpp
/// Unit tests for api_client.hpp against the in-memory transport: retry
/// loop, 401 refresh, cache short-circuit and error mapping.

#include "api_client.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "interceptors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <any>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using namespace capi_pipeline;
using namespace capi_pipeline::testing_support;
using json = nlohmann::json;
using namespace std::chrono_literals;

static ClientOptions fastOptions() {
    ClientOptions options;
    options.baseUrl = "http://api.test";
    options.retry   = RetryConfig(3, 1ms, 5ms, {429, 500, 502, 503, 504});
    return options;
}

/// Counts refreshes and hands out numbered tokens.
class CountingTokenManager : public TokenManager {
public:
    std::string getToken(const CancelToken&) override {
        return "token-" + std::to_string(mRefreshes.load());
    }
    void refreshToken(const CancelToken&) override { ++mRefreshes; }
    void setToken(const std::string&, SystemClock::time_point) override {}

    int refreshes() const { return mRefreshes.load(); }

private:
    std::atomic<int> mRefreshes{0};
};

// ============================================================================
// URL and wire request
// ============================================================================

TEST(ApiClient, BuildUrlWithQuery) {
    FakeTransport transport;
    ApiClient client(transport, fastOptions());

    Request req;
    req.path  = "/v3/apps";
    req.query = {{"per_page", "50"}, {"names", "a b"}};
    EXPECT_EQ(client.buildUrl(req), "http://api.test/v3/apps?names=a%20b&per_page=50");

    req.query.clear();
    EXPECT_EQ(client.buildUrl(req), "http://api.test/v3/apps");
}

TEST(ApiClient, SendsDefaultAndJsonHeaders) {
    FakeTransport transport;
    auto options = fastOptions();
    options.defaultHeaders["X-Team"] = "core";
    ApiClient client(transport, options);

    client.post(CancelToken(), "/v3/apps", json{{"name", "demo"}});

    const auto sent = transport.lastRequest();
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "http://api.test/v3/apps");
    EXPECT_EQ(sent.headers.at("accept"), "application/json");
    EXPECT_EQ(sent.headers.at("User-Agent"), "capi_pipeline/1.0");
    EXPECT_EQ(sent.headers.at("X-Team"), "core");
    EXPECT_EQ(sent.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(json::parse(sent.body), json({{"name", "demo"}}));
}

TEST(ApiClient, DeleteHasNoBody) {
    FakeTransport transport;
    transport.enqueueJson(202, nullptr, {{"Location", "http://api.test/v3/jobs/1"}});
    ApiClient client(transport, fastOptions());

    auto resp = client.remove(CancelToken(), "/v3/apps/1");
    EXPECT_EQ(resp.status, 202u);
    EXPECT_EQ(resp.header("location"), "http://api.test/v3/jobs/1");
    EXPECT_EQ(transport.lastRequest().method, "DELETE");
    EXPECT_TRUE(transport.lastRequest().body.empty());
    EXPECT_TRUE(responseJson(resp).is_null());
}

TEST(ApiClient, InterceptorsSeeEveryExchange) {
    FakeTransport transport;
    ApiClient client(transport, fastOptions());
    client.interceptors().addRequestInterceptor(headerInterceptor({{"X-Trace", "t1"}}));

    int seen = 0;
    client.interceptors().addResponseInterceptor(
        [&seen](const CancelToken&, const Request& req, Response& resp) {
            ++seen;
            EXPECT_EQ(req.header("X-Trace"), "t1");
            EXPECT_EQ(resp.status, 200u);
        });

    client.get(CancelToken(), "/v3/info");
    EXPECT_EQ(seen, 1);
    EXPECT_EQ(transport.lastRequest().headers.at("X-Trace"), "t1");
}

// ============================================================================
// Retry
// ============================================================================

TEST(ApiClient, RetriesUntilSuccess) {
    FakeTransport transport;
    transport.enqueueJson(503, nullptr);
    transport.enqueueJson(503, nullptr);
    transport.enqueueJson(200, {{"ok", true}});

    ApiClient client(transport, fastOptions());
    client.interceptors().addResponseInterceptor(
        retryResponseInterceptor(client.options().retry));

    auto resp = client.get(CancelToken(), "/v3/apps");
    EXPECT_EQ(resp.status, 200u);
    EXPECT_EQ(responseJson(resp)["ok"], true);
    EXPECT_EQ(transport.requestCount(), 3u);
}

TEST(ApiClient, AttemptNumberIsRecorded) {
    FakeTransport transport;
    transport.enqueueJson(500, nullptr);
    transport.enqueueJson(200, json::object());

    ApiClient client(transport, fastOptions());
    client.interceptors().addResponseInterceptor(
        retryResponseInterceptor(client.options().retry));

    std::vector<int> attempts;
    client.interceptors().addRequestInterceptor([&attempts](const CancelToken&, Request& req) {
        attempts.push_back(std::any_cast<int>(req.metadata.at(meta::kAttempt)));
    });

    client.get(CancelToken(), "/v3/apps");
    EXPECT_EQ(attempts, (std::vector<int>{0, 1}));
}

TEST(ApiClient, RetriesExhaustedThrowsApiError) {
    FakeTransport transport;
    transport.setHandler([](const HttpRequest&) {
        return jsonResponse(503, {{"errors", {{{"code", 10001}, {"title", "CF-ServiceUnavailable"},
                                               {"detail", "try later"}}}}});
    });

    ApiClient client(transport, fastOptions());
    client.interceptors().addResponseInterceptor(
        retryResponseInterceptor(client.options().retry));

    try {
        client.get(CancelToken(), "/v3/apps");
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.httpStatus(), 503u);
        ASSERT_NE(e.firstError(), nullptr);
        EXPECT_EQ(e.firstError()->code, kErrorCodeServiceUnavailable);
    }
    EXPECT_EQ(transport.requestCount(), 4u);
}

TEST(ApiClient, NoRetryWhenDisabled) {
    FakeTransport transport;
    transport.enqueueJson(503, nullptr);

    auto options = fastOptions();
    options.enableRetry = false;
    ApiClient client(transport, options);
    client.interceptors().addResponseInterceptor(retryResponseInterceptor(options.retry));

    EXPECT_THROW(client.get(CancelToken(), "/v3/apps"), ApiError);
    EXPECT_EQ(transport.requestCount(), 1u);
}

TEST(ApiClient, ClientErrorsAreNotRetried) {
    FakeTransport transport;
    transport.enqueueJson(404, {{"errors", {{{"code", 10010}, {"title", "CF-ResourceNotFound"},
                                             {"detail", "App not found"}}}}});

    ApiClient client(transport, fastOptions());
    client.interceptors().addResponseInterceptor(
        retryResponseInterceptor(client.options().retry));

    try {
        client.get(CancelToken(), "/v3/apps/missing");
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_TRUE(e.isNotFound());
        EXPECT_STREQ(e.what(), "CF-ResourceNotFound: App not found (code: 10010)");
    }
    EXPECT_EQ(transport.requestCount(), 1u);
}

TEST(ApiClient, MistypedErrorBodyStillSurfacesAsApiError) {
    FakeTransport transport;
    transport.enqueueJson(400, {{"errors", {{{"code", "CF-Oops"}, {"title", nullptr}}}}});

    ApiClient client(transport, fastOptions());
    try {
        client.get(CancelToken(), "/v3/apps");
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.httpStatus(), 400u);
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.firstError()->code, 0);
    }
}

TEST(ApiClient, TransportErrorsAreRetriedThenRethrown) {
    FakeTransport transport;
    for (int i = 0; i < 4; ++i) transport.enqueueTransportError("connection refused");

    ApiClient client(transport, fastOptions());
    try {
        client.get(CancelToken(), "/v3/apps");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_STREQ(e.what(), "connection refused");
    }
    EXPECT_EQ(transport.requestCount(), 4u);
}

TEST(ApiClient, TransportErrorThenSuccess) {
    FakeTransport transport;
    transport.enqueueTransportError("reset by peer");
    transport.enqueueJson(200, {{"guid", "a1"}});

    ApiClient client(transport, fastOptions());
    auto resp = client.get(CancelToken(), "/v3/apps/a1");
    EXPECT_EQ(responseJson(resp)["guid"], "a1");
    EXPECT_EQ(transport.requestCount(), 2u);
}

// ============================================================================
// Authentication refresh
// ============================================================================

TEST(ApiClient, UnauthorizedTriggersOneRefresh) {
    FakeTransport transport;
    transport.enqueueJson(401, nullptr);
    transport.enqueueJson(200, json::object());

    CountingTokenManager tokens;
    auto options = fastOptions();
    options.tokenManager = &tokens;
    ApiClient client(transport, options);
    client.interceptors().addRequestInterceptor(authenticationInterceptor(
        [&tokens](const CancelToken& c) { return tokens.getToken(c); }));

    auto resp = client.get(CancelToken(), "/v3/apps");
    EXPECT_EQ(resp.status, 200u);
    EXPECT_EQ(tokens.refreshes(), 1);

    const auto sent = transport.requests();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].headers.at("Authorization"), "Bearer token-0");
    EXPECT_EQ(sent[1].headers.at("Authorization"), "Bearer token-1");
}

TEST(ApiClient, RepeatedUnauthorizedSurfaces) {
    FakeTransport transport;
    transport.setHandler([](const HttpRequest&) { return jsonResponse(401, nullptr); });

    CountingTokenManager tokens;
    auto options = fastOptions();
    options.tokenManager = &tokens;
    ApiClient client(transport, options);

    try {
        client.get(CancelToken(), "/v3/apps");
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_TRUE(e.isUnauthorized());
    }
    EXPECT_EQ(tokens.refreshes(), 1);
    EXPECT_EQ(transport.requestCount(), 2u);
}

TEST(ApiClient, UnauthorizedWithoutTokenManager) {
    FakeTransport transport;
    transport.enqueueJson(401, nullptr);
    ApiClient client(transport, fastOptions());

    EXPECT_THROW(client.get(CancelToken(), "/v3/apps"), ApiError);
    EXPECT_EQ(transport.requestCount(), 1u);
}

// ============================================================================
// Cache short-circuit and cancellation
// ============================================================================

TEST(ApiClient, CachedBodySkipsTransport) {
    FakeTransport transport;
    ApiClient client(transport, fastOptions());
    client.interceptors().addRequestInterceptor([](const CancelToken&, Request& req) {
        req.metadata[meta::kCachedBody] = std::string(R"({"cached":true})");
    });

    auto resp = client.get(CancelToken(), "/v3/apps");
    EXPECT_EQ(resp.status, 200u);
    EXPECT_EQ(resp.header(kCacheStatusHeader), "HIT");
    EXPECT_EQ(responseJson(resp)["cached"], true);
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST(ApiClient, CancelledTokenStopsBeforeSending) {
    FakeTransport transport;
    ApiClient client(transport, fastOptions());

    CancelToken cancel;
    cancel.cancel();
    try {
        client.get(cancel, "/v3/apps");
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST(ApiClient, RequestInterceptorErrorAbortsCycle) {
    FakeTransport transport;
    ApiClient client(transport, fastOptions());
    client.interceptors().addRequestInterceptor(
        [](const CancelToken&, Request&) { throw CircuitOpenError(); });

    EXPECT_THROW(client.get(CancelToken(), "/v3/apps"), CircuitOpenError);
    EXPECT_EQ(transport.requestCount(), 0u);
}

// ============================================================================
// responseJson
// ============================================================================

TEST(ResponseJson, InvalidBodyThrows) {
    Response resp;
    resp.status = 200;
    resp.body   = "<html>";
    try {
        responseJson(resp);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPayload);
    }
}
