#include "api_client.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <any>

namespace capi_pipeline {

ApiClient::ApiClient(HttpTransport& transport, ClientOptions options)
    : mTransport(transport)
    , mOptions(std::move(options))
    , mLogger(mOptions.logger ? mOptions.logger : std::make_shared<NullLogger>())
{
    mOptions.defaultHeaders.emplace("Accept", "application/json");
    mOptions.defaultHeaders.emplace("User-Agent", mOptions.userAgent);
}

std::string ApiClient::buildUrl(const Request& request) const {
    std::string url = joinUrl(mOptions.baseUrl, request.path);
    if (!request.query.empty()) {
        url += (url.find('?') == std::string::npos ? "?" : "&") + encodeQuery(request.query);
    }
    return url;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

Response ApiClient::execute(const CancelToken& cancel, Request request) {
    const int maxAttempts = mOptions.enableRetry ? 1 + mOptions.retry.maxRetries() : 1;
    bool tokenRefreshed = false;

    Response response;
    int attempt = 0;
    while (true) {
        cancel.throwIfCancelled();

        Request attemptRequest = request;
        attemptRequest.metadata[meta::kAttempt] = attempt;

        mChain.executeRequestInterceptors(cancel, attemptRequest);
        response = dispatch(cancel, attemptRequest);
        mChain.executeResponseInterceptors(cancel, attemptRequest, response);

        if (!response.error && response.status == 401 && mOptions.tokenManager && !tokenRefreshed) {
            tokenRefreshed = true;
            mLogger->info("Refreshing token after 401", {{"path", request.path}});
            mOptions.tokenManager->refreshToken(cancel);
            continue;
        }

        const bool retryable = response.error != nullptr ||
                               response.header(kShouldRetryHeader) == "true";
        if (!retryable || attempt + 1 >= maxAttempts) {
            break;
        }

        auto delay = computeBackoffMs(attempt, mOptions.retry.baseDelay(),
                                      mOptions.retry.maxDelay());
        mLogger->warn("Retrying request",
                      {{"method", request.method},
                       {"path", request.path},
                       {"attempt", std::to_string(attempt + 1)},
                       {"delay_ms", std::to_string(delay.count())}});
        cancel.sleepFor(delay);
        ++attempt;
    }

    if (response.error) {
        std::rethrow_exception(response.error);
    }
    if (response.status >= 400) {
        throw parseApiError(response.status, response.body);
    }
    return response;
}

Response ApiClient::dispatch(const CancelToken& cancel, const Request& request) {
    Response response;

    auto cached = request.metadata.find(meta::kCachedBody);
    if (cached != request.metadata.end()) {
        response.status = 200;
        response.body   = std::any_cast<std::string>(cached->second);
        response.headers["Content-Type"]     = "application/json";
        response.headers[kCacheStatusHeader] = "HIT";
        return response;
    }

    HttpRequest wire;
    wire.method = toUpper(request.method);
    wire.url    = buildUrl(request);
    wire.body   = request.body;
    for (const auto& [name, value] : mOptions.defaultHeaders) {
        wire.headers[name] = value;
    }
    for (const auto& [name, value] : request.headers) {
        wire.headers[name] = value;
    }
    if (!wire.body.empty() && wire.headers.find("Content-Type") == wire.headers.end()) {
        wire.headers["Content-Type"] = "application/json";
    }

    try {
        HttpResponse http = mTransport.send(wire, cancel.withTimeout(mOptions.timeout));
        response.status  = http.status;
        response.headers = std::move(http.headers);
        response.body    = std::move(http.body);
    } catch (const TransportError&) {
        response.error = std::current_exception();
    } catch (const CancelledError&) {
        // Our per-attempt timeout fired, not the caller's token.
        if (cancel.isCancelled()) throw;
        response.error = std::make_exception_ptr(TransportError(
            "request timed out after " + std::to_string(mOptions.timeout.count()) + "ms"));
    }
    return response;
}

// ---------------------------------------------------------------------------
// Convenience wrappers
// ---------------------------------------------------------------------------

Response ApiClient::get(const CancelToken& cancel, const std::string& path,
                        const QueryParams& query) {
    Request request;
    request.method = "GET";
    request.path   = path;
    request.query  = query;
    return execute(cancel, std::move(request));
}

namespace {
Request withJsonBody(const std::string& method, const std::string& path,
                     const nlohmann::json& body) {
    Request request;
    request.method = method;
    request.path   = path;
    if (!body.is_null()) {
        request.body = body.dump();
        request.headers["Content-Type"] = "application/json";
    }
    return request;
}
} // namespace

Response ApiClient::post(const CancelToken& cancel, const std::string& path,
                         const nlohmann::json& body) {
    return execute(cancel, withJsonBody("POST", path, body));
}

Response ApiClient::put(const CancelToken& cancel, const std::string& path,
                        const nlohmann::json& body) {
    return execute(cancel, withJsonBody("PUT", path, body));
}

Response ApiClient::patch(const CancelToken& cancel, const std::string& path,
                          const nlohmann::json& body) {
    return execute(cancel, withJsonBody("PATCH", path, body));
}

Response ApiClient::remove(const CancelToken& cancel, const std::string& path) {
    Request request;
    request.method = "DELETE";
    request.path   = path;
    return execute(cancel, std::move(request));
}

nlohmann::json responseJson(const Response& response) {
    if (response.body.empty()) {
        return nullptr;
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw PipelineError(ErrorKind::InvalidPayload,
                            std::string("invalid JSON response: ") + e.what());
    }
}

} // namespace capi_pipeline
