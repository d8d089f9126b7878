#include "http_transport.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CAPI_PIPELINE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace capi_pipeline {

namespace {

http::request<http::string_body>
buildBeastRequest(const UrlParts& url, const HttpRequest& request,
                  const std::string& userAgent)
{
    const auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, userAgent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse toHttpResponse(const http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = res.body();
    return response;
}

/// Write the request and read the response over an already-connected
/// stream.  Works for both plain TCP and TLS streams.
template <class Stream>
HttpResponse exchange(Stream& stream,
                      const http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout)
{
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::read(stream, buffer, res);

    return toHttpResponse(res);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(std::chrono::milliseconds timeout,
                               std::string userAgent)
    : mTimeout(timeout)
    , mUserAgent(std::move(userAgent)) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request,
                                  const CancelToken& cancel)
{
    cancel.throwIfCancelled();

    const auto url = parseUrl(request.url);

    if (mVerbose) {
        std::cerr << "[BeastTransport] " << request.method << " "
                  << url.host << ":" << url.port << url.target << "\n";
    }

    HttpResponse response;
    try {
        response = (url.scheme == "https") ? doHttpsRequest(url, request, cancel)
                                           : doHttpRequest(url, request, cancel);
    } catch (const beast::system_error& e) {
        // An expired deadline surfaces as a socket timeout; report it as
        // the cancellation it really is.
        cancel.throwIfCancelled();
        throw TransportError(request.method + " " + request.url + ": " + e.what());
    }

    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << response.status << "\n";
    }
    return response;
}

std::chrono::milliseconds
BeastTransport::effectiveTimeout(const CancelToken& cancel) const {
    const auto left = cancel.remaining();
    if (!left) return mTimeout;
    return std::min(mTimeout,
                    std::chrono::duration_cast<std::chrono::milliseconds>(*left));
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const UrlParts& url,
                                           const HttpRequest& request,
                                           const CancelToken& cancel)
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    const auto timeout = effectiveTimeout(cancel);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(url.host, url.port);
    stream.expires_after(timeout);
    stream.connect(results);

    const auto req = buildBeastRequest(url, request, mUserAgent);
    auto response  = exchange(stream, req, timeout);

    // Graceful shutdown (non-critical errors are ignored).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const UrlParts& url,
                                            const HttpRequest& request,
                                            const CancelToken& cancel)
{
#ifdef CAPI_PIPELINE_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(mSkipTlsVerify ? ssl::verify_none : ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw TransportError("Failed to set SNI hostname for " + url.host);
    }

    const auto timeout = effectiveTimeout(cancel);

    auto const results = resolver.resolve(url.host, url.port);
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    const auto req = buildBeastRequest(url, request, mUserAgent);
    auto response  = exchange(stream, req, timeout);

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)url;
    (void)request;
    (void)cancel;
    throw TransportError("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace capi_pipeline
