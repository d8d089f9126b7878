#include "interceptors.hpp"

namespace capi_pipeline {

// ---------------------------------------------------------------------------
// InterceptorChain
// ---------------------------------------------------------------------------

void InterceptorChain::addRequestInterceptor(RequestInterceptor interceptor) {
    std::lock_guard<std::mutex> lock(mMutex);
    mRequestInterceptors.push_back(std::move(interceptor));
}

void InterceptorChain::addResponseInterceptor(ResponseInterceptor interceptor) {
    std::lock_guard<std::mutex> lock(mMutex);
    mResponseInterceptors.push_back(std::move(interceptor));
}

void InterceptorChain::executeRequestInterceptors(const CancelToken& cancel,
                                                  Request& request) const {
    std::vector<RequestInterceptor> snapshot;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        snapshot = mRequestInterceptors;
    }
    for (const auto& interceptor : snapshot) {
        interceptor(cancel, request);
    }
}

void InterceptorChain::executeResponseInterceptors(const CancelToken& cancel,
                                                   const Request& request,
                                                   Response& response) const {
    std::vector<ResponseInterceptor> snapshot;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        snapshot = mResponseInterceptors;
    }
    for (const auto& interceptor : snapshot) {
        interceptor(cancel, request, response);
    }
}

std::size_t InterceptorChain::requestInterceptorCount() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRequestInterceptors.size();
}

std::size_t InterceptorChain::responseInterceptorCount() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mResponseInterceptors.size();
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

RequestInterceptor loggingInterceptor(std::shared_ptr<Logger> logger) {
    return [logger](const CancelToken&, Request& request) {
        logger->debug("API Request", {{"method", request.method},
                                      {"path", request.path}});
    };
}

ResponseInterceptor loggingResponseInterceptor(std::shared_ptr<Logger> logger) {
    return [logger](const CancelToken&, const Request& request, Response& response) {
        LogFields fields = {{"method", request.method},
                            {"path", request.path},
                            {"status_code", std::to_string(response.status)}};
        if (response.failed()) {
            logger->error("API Response Error", fields);
        } else {
            logger->debug("API Response", fields);
        }
    };
}

// ---------------------------------------------------------------------------
// Headers / auth
// ---------------------------------------------------------------------------

RequestInterceptor headerInterceptor(std::map<std::string, std::string> headers) {
    return [headers = std::move(headers)](const CancelToken&, Request& request) {
        for (const auto& [name, value] : headers) {
            request.headers[name] = value;
        }
    };
}

RequestInterceptor authenticationInterceptor(TokenProvider tokenProvider) {
    return [tokenProvider = std::move(tokenProvider)](const CancelToken& cancel,
                                                      Request& request) {
        const auto token = tokenProvider(cancel);
        if (token.empty()) return;
        request.headers["Authorization"] = "Bearer " + token;
    };
}

// ---------------------------------------------------------------------------
// Retry classification
// ---------------------------------------------------------------------------

ResponseInterceptor retryResponseInterceptor(RetryConfig config) {
    return [config = std::move(config)](const CancelToken&, const Request&,
                                        Response& response) {
        if (config.isRetryable(response.status)) {
            response.headers[kShouldRetryHeader] = "true";
        }
    };
}

} // namespace capi_pipeline
