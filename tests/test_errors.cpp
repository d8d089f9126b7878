/// @file test_errors.cpp
/// Unit tests for errors.hpp: API error decoding, predicates and kind
/// helpers.

#include "errors.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <string>

using namespace capi_pipeline;

TEST(ParseApiError, SingleError) {
    auto err = parseApiError(
        404, R"({"errors":[{"code":10010,"title":"CF-ResourceNotFound","detail":"App not found"}]})");
    EXPECT_EQ(err.httpStatus(), 404u);
    ASSERT_EQ(err.errors().size(), 1u);
    EXPECT_EQ(err.firstError()->title, "CF-ResourceNotFound");
    EXPECT_STREQ(err.what(), "CF-ResourceNotFound: App not found (code: 10010)");
    EXPECT_EQ(err.kind(), ErrorKind::Api);
    EXPECT_TRUE(err.isNotFound());
    EXPECT_FALSE(err.isUnauthorized());
}

TEST(ParseApiError, MultipleErrors) {
    auto err = parseApiError(422, R"({"errors":[
        {"code":10008,"title":"CF-UnprocessableEntity","detail":"name is taken"},
        {"code":10016,"title":"CF-UniquenessError","detail":"duplicate"}]})");
    EXPECT_EQ(err.errors().size(), 2u);
    EXPECT_STREQ(err.what(),
                 "multiple errors: [CF-UnprocessableEntity: name is taken (code: 10008); "
                 "CF-UniquenessError: duplicate (code: 10016)]");
}

TEST(ParseApiError, UnstructuredBody) {
    auto err = parseApiError(502, "<html>Bad Gateway</html>");
    EXPECT_TRUE(err.errors().empty());
    EXPECT_EQ(err.firstError(), nullptr);
    EXPECT_STREQ(err.what(), "unknown error (HTTP 502)");

    EXPECT_TRUE(parseApiError(500, "").errors().empty());
    EXPECT_TRUE(parseApiError(500, R"({"errors":"nope"})").errors().empty());
}

TEST(ParseApiError, MistypedFieldsDecodeAsDefaults) {
    auto err = parseApiError(500, R"({"errors":[{"code":"CF-Oops","title":null,"detail":42}]})");
    EXPECT_EQ(err.kind(), ErrorKind::Api);
    ASSERT_EQ(err.errors().size(), 1u);
    EXPECT_EQ(err.firstError()->code, 0);
    EXPECT_EQ(err.firstError()->title, "");
    EXPECT_EQ(err.firstError()->detail, "");
    EXPECT_FALSE(err.isNotFound());

    auto named = parseApiError(404, R"({"errors":[{"code":10010.5,"title":"CF-ResourceNotFound"}]})");
    EXPECT_EQ(named.firstError()->code, 0);
    EXPECT_EQ(named.firstError()->title, "CF-ResourceNotFound");
    EXPECT_TRUE(named.isNotFound());
}

TEST(ApiError, PredicatesFallBackToStatus) {
    EXPECT_TRUE(parseApiError(404, "").isNotFound());
    EXPECT_TRUE(parseApiError(401, "").isUnauthorized());
    EXPECT_TRUE(parseApiError(403, "").isForbidden());
    EXPECT_FALSE(parseApiError(500, "").isForbidden());
}

TEST(ApiError, PredicatesPreferErrorCode) {
    auto err = parseApiError(400, R"({"errors":[{"code":10002,"title":"CF-NotAuthenticated","detail":""}]})");
    EXPECT_TRUE(err.isUnauthorized());
    EXPECT_FALSE(err.isNotFound());
}

TEST(ErrorPredicates, OnExceptionPointers) {
    auto notFound = std::make_exception_ptr(parseApiError(404, ""));
    auto forbidden = std::make_exception_ptr(parseApiError(403, ""));
    auto transport = std::make_exception_ptr(TransportError("reset"));

    EXPECT_TRUE(isNotFound(notFound));
    EXPECT_TRUE(isForbidden(forbidden));
    EXPECT_FALSE(isNotFound(transport));
    EXPECT_FALSE(isUnauthorized(nullptr));
}

TEST(ErrorKind, NamesAndLookup) {
    EXPECT_STREQ(errorKindName(ErrorKind::CircuitOpen), "circuit_open");
    EXPECT_STREQ(errorKindName(ErrorKind::TransactionFailed), "transaction_failed");

    EXPECT_EQ(errorKindOf(std::make_exception_ptr(CircuitOpenError())), ErrorKind::CircuitOpen);
    EXPECT_EQ(errorKindOf(std::make_exception_ptr(CacheError(ErrorKind::CacheMiss, "x"))),
              ErrorKind::CacheMiss);
    EXPECT_FALSE(errorKindOf(std::make_exception_ptr(std::runtime_error("plain"))).has_value());
    EXPECT_FALSE(errorKindOf(nullptr).has_value());
}

TEST(DescribeError, Messages) {
    EXPECT_EQ(describeError(nullptr), "");
    EXPECT_EQ(describeError(std::make_exception_ptr(CircuitOpenError())), "circuit breaker is open");
    EXPECT_EQ(describeError(std::make_exception_ptr(std::runtime_error("plain"))), "plain");
}

TEST(AuthenticationError, CarriesUpstreamDetails) {
    AuthenticationError err("token request failed", "invalid_client", "Bad credentials", 401);
    EXPECT_EQ(err.kind(), ErrorKind::Authentication);
    EXPECT_EQ(err.upstreamError(), "invalid_client");
    EXPECT_EQ(err.upstreamDescription(), "Bad credentials");
    EXPECT_EQ(err.httpStatus(), 401u);
}

TEST(BatchOperationError, CarriesOperationId) {
    BatchOperationError err(ErrorKind::UnsupportedResource, "op-7", "unsupported resource type: x");
    EXPECT_EQ(err.operationId(), "op-7");
    EXPECT_EQ(err.kind(), ErrorKind::UnsupportedResource);
}
