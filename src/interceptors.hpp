#pragma once

#include "cancellation.hpp"
#include "logger.hpp"
#include "request.hpp"
#include "retry.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capi_pipeline {

/// Runs before the request is sent.  Throws to abort the cycle.
using RequestInterceptor =
    std::function<void(const CancelToken& cancel, Request& request)>;

/// Runs after the response (or transport failure) is known.
using ResponseInterceptor =
    std::function<void(const CancelToken& cancel, const Request& request,
                       Response& response)>;

/// Returns a bearer token; throws on failure.
using TokenProvider = std::function<std::string(const CancelToken& cancel)>;

/// Ordered request/response middleware.
///
/// Interceptors run strictly in registration order.  The first exception
/// stops the phase and propagates unchanged; later interceptors do not run.
/// Safe to share between threads: execution works on a snapshot of the
/// list taken under the chain's lock.
class InterceptorChain {
public:
    void addRequestInterceptor(RequestInterceptor interceptor);
    void addResponseInterceptor(ResponseInterceptor interceptor);

    void executeRequestInterceptors(const CancelToken& cancel, Request& request) const;
    void executeResponseInterceptors(const CancelToken& cancel, const Request& request,
                                     Response& response) const;

    std::size_t requestInterceptorCount() const;
    std::size_t responseInterceptorCount() const;

private:
    mutable std::mutex               mMutex;
    std::vector<RequestInterceptor>  mRequestInterceptors;
    std::vector<ResponseInterceptor> mResponseInterceptors;
};

// ---------------------------------------------------------------------------
// Stock interceptors
// ---------------------------------------------------------------------------

/// Debug record "API Request" with method and path.
RequestInterceptor loggingInterceptor(std::shared_ptr<Logger> logger);

/// "API Response" at debug level, or "API Response Error" at error level
/// when the response failed.
ResponseInterceptor loggingResponseInterceptor(std::shared_ptr<Logger> logger);

/// Sets each header on every request.
RequestInterceptor headerInterceptor(std::map<std::string, std::string> headers);

/// Sets "Authorization: Bearer <token>".  An empty token (no-auth mode)
/// leaves the request without the header.
RequestInterceptor authenticationInterceptor(TokenProvider tokenProvider);

/// Marks responses whose status is retryable with "X-Should-Retry: true".
/// Only classifies; ApiClient performs the retry.
ResponseInterceptor retryResponseInterceptor(RetryConfig config = RetryConfig());

} // namespace capi_pipeline
