#pragma once

#include "cancellation.hpp"
#include "http_types.hpp"
#include "util.hpp"

#include <chrono>
#include <string>

namespace capi_pipeline {

/// Performs one HTTP exchange.  Implementations throw TransportError on
/// network failures and CancelledError when the token fires first; any
/// HTTP status (including 4xx/5xx) is a successful exchange.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request,
                              const CancelToken& cancel) = 0;
};

/// Synchronous HTTP/1.1 transport built on Boost.Beast.
/// One connection per exchange.  HTTPS requires a build with OpenSSL
/// (CAPI_PIPELINE_HAS_SSL).
class BeastTransport : public HttpTransport {
public:
    /// @param timeout  Per-phase (connect / write / read) timeout; a tighter
    ///                 deadline on the CancelToken wins.
    explicit BeastTransport(std::chrono::milliseconds timeout = std::chrono::seconds(30),
                            std::string userAgent = "capi_pipeline/1.0");

    HttpResponse send(const HttpRequest& request,
                      const CancelToken& cancel) override;

    void setVerbose(bool v) { mVerbose = v; }

    /// Skip certificate verification (development endpoints only).
    void setSkipTlsVerify(bool v) { mSkipTlsVerify = v; }

private:
    std::chrono::milliseconds mTimeout;
    std::string               mUserAgent;
    bool                      mVerbose       = false;
    bool                      mSkipTlsVerify = false;

    std::chrono::milliseconds effectiveTimeout(const CancelToken& cancel) const;

    HttpResponse doHttpRequest(const UrlParts& url, const HttpRequest& request,
                               const CancelToken& cancel);
    HttpResponse doHttpsRequest(const UrlParts& url, const HttpRequest& request,
                                const CancelToken& cancel);
};

} // namespace capi_pipeline
