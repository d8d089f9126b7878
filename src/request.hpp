#pragma once

#include "http_types.hpp"

#include <any>
#include <exception>
#include <map>
#include <string>

namespace capi_pipeline {

using QueryParams = std::map<std::string, std::string>;

/// Side-channel values attached to a request while it travels the chain.
using Metadata = std::map<std::string, std::any>;

// Metadata keys understood by the stock interceptors and ApiClient.
namespace meta {
constexpr const char* kStartTime  = "start_time";   // steady_clock::time_point
constexpr const char* kCachedBody = "cached_body";  // std::string
constexpr const char* kAttempt    = "attempt";      // int, 0-based
}

/// Response header set by the retry interceptor.
constexpr const char* kShouldRetryHeader = "X-Should-Retry";

/// Response header set when a body was served from the cache.
constexpr const char* kCacheStatusHeader = "X-Cache";

/// Interceptor-time request.  Owned by exactly one request/response cycle.
struct Request {
    std::string method = "GET";
    std::string path;
    QueryParams query;
    Headers     headers;
    std::string body;
    Metadata    metadata;

    /// Header value or "" when absent.
    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

/// Interceptor-time response.  `error` carries a transport failure so that
/// response interceptors can observe it before it is rethrown.
struct Response {
    unsigned int       status = 0;
    Headers            headers;
    std::string        body;
    std::exception_ptr error;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    bool failed() const { return error != nullptr || status >= 400; }
};

} // namespace capi_pipeline
