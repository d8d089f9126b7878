#pragma once

#include "cancellation.hpp"
#include "http_transport.hpp"
#include "interceptors.hpp"
#include "logger.hpp"
#include "request.hpp"
#include "retry.hpp"
#include "token_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace capi_pipeline {

struct ClientOptions {
    std::string                        baseUrl;
    std::string                        userAgent = "capi_pipeline/1.0";
    /// Sent with every request unless the request sets the same header.
    std::map<std::string, std::string> defaultHeaders;
    /// Upper bound for one attempt, including transport I/O.
    std::chrono::milliseconds          timeout{std::chrono::seconds(30)};
    RetryConfig                        retry;
    bool                               enableRetry = true;
    /// When set, a 401 triggers one token refresh and one more attempt.
    TokenManager*                      tokenManager = nullptr;
    std::shared_ptr<Logger>            logger;
};

/// Runs the interceptor chain around each HTTP exchange.
///
/// Per attempt: request interceptors, then either the cached body they left
/// in meta::kCachedBody or one call through the transport, then response
/// interceptors.  The attempt is repeated with exponential backoff while
/// the response carries X-Should-Retry (or the transport failed) and
/// attempts remain.  The final outcome is returned for status < 400;
/// otherwise ApiError or TransportError is thrown.
class ApiClient {
public:
    ApiClient(HttpTransport& transport, ClientOptions options);

    InterceptorChain& interceptors() { return mChain; }
    const ClientOptions& options() const { return mOptions; }

    Response execute(const CancelToken& cancel, Request request);

    Response get(const CancelToken& cancel, const std::string& path,
                 const QueryParams& query = QueryParams());
    Response post(const CancelToken& cancel, const std::string& path,
                  const nlohmann::json& body);
    Response put(const CancelToken& cancel, const std::string& path,
                 const nlohmann::json& body);
    Response patch(const CancelToken& cancel, const std::string& path,
                   const nlohmann::json& body);
    Response remove(const CancelToken& cancel, const std::string& path);

    /// Absolute URL: base URL + path + "?" + encoded query.
    std::string buildUrl(const Request& request) const;

private:
    HttpTransport&          mTransport;
    ClientOptions           mOptions;
    std::shared_ptr<Logger> mLogger;
    InterceptorChain        mChain;

    Response dispatch(const CancelToken& cancel, const Request& request);
};

/// Body of @p response as JSON (null for an empty body).  Throws
/// PipelineError(InvalidPayload) when the body is not JSON.
nlohmann::json responseJson(const Response& response);

} // namespace capi_pipeline
