/// @file test_beast_transport.cpp
/// BeastTransport against a one-shot loopback HTTP server.

#include "errors.hpp"
#include "http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using namespace capi_pipeline;

namespace {

/// Accepts a single connection, records the request and answers with a
/// fixed response.
class OneShotServer {
public:
    OneShotServer(unsigned int status, std::string body)
        : mAcceptor(mIoc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , mStatus(status)
        , mBody(std::move(body))
    {
        mThread = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        if (mThread.joinable()) mThread.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(mAcceptor.local_endpoint().port()) + target;
    }

    /// Valid once the exchange has completed.
    const http::request<http::string_body>& received() {
        if (mThread.joinable()) mThread.join();
        return mRequest;
    }

private:
    void serve() {
        tcp::socket socket(mIoc);
        beast::error_code ec;
        mAcceptor.accept(socket, ec);
        if (ec) return;

        beast::flat_buffer buffer;
        http::read(socket, buffer, mRequest, ec);
        if (ec) return;

        http::response<http::string_body> res{static_cast<http::status>(mStatus), 11};
        res.set(http::field::content_type, "application/json");
        res.set("ETag", "\"v1\"");
        res.body() = mBody;
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    net::io_context                  mIoc;
    tcp::acceptor                    mAcceptor;
    unsigned int                     mStatus;
    std::string                      mBody;
    http::request<http::string_body> mRequest;
    std::thread                      mThread;
};

} // namespace

TEST(BeastTransport, GetRoundTrip) {
    OneShotServer server(200, R"({"guid":"a1"})");
    BeastTransport transport(std::chrono::seconds(5), "capi_pipeline-test");

    HttpRequest request;
    request.method = "GET";
    request.url    = server.url("/v3/apps/a1?include=space");
    request.headers["Authorization"] = "Bearer t";

    auto response = transport.send(request, CancelToken());
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.body, R"({"guid":"a1"})");
    EXPECT_EQ(response.headers.at("etag"), "\"v1\"");

    const auto& received = server.received();
    EXPECT_EQ(received.method(), http::verb::get);
    EXPECT_EQ(std::string(received.target()), "/v3/apps/a1?include=space");
    EXPECT_EQ(std::string(received[http::field::authorization]), "Bearer t");
    EXPECT_EQ(std::string(received[http::field::user_agent]), "capi_pipeline-test");
}

TEST(BeastTransport, PostSendsBody) {
    OneShotServer server(201, R"({"guid":"new"})");
    BeastTransport transport;

    HttpRequest request;
    request.method = "POST";
    request.url    = server.url("/v3/apps");
    request.body   = R"({"name":"demo"})";
    request.headers["Content-Type"] = "application/json";

    auto response = transport.send(request, CancelToken());
    EXPECT_EQ(response.status, 201u);

    const auto& received = server.received();
    EXPECT_EQ(received.method(), http::verb::post);
    EXPECT_EQ(received.body(), R"({"name":"demo"})");
    EXPECT_EQ(std::string(received[http::field::content_type]), "application/json");
}

TEST(BeastTransport, ErrorStatusIsNotAnException) {
    OneShotServer server(503, R"({"errors":[]})");
    BeastTransport transport;

    HttpRequest request;
    request.url = server.url("/v3/info");
    auto response = transport.send(request, CancelToken());
    EXPECT_EQ(response.status, 503u);
    server.received();
}

TEST(BeastTransport, ConnectionRefusedIsTransportError) {
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    BeastTransport transport(std::chrono::seconds(2));
    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/v3/info";
    EXPECT_THROW(transport.send(request, CancelToken()), TransportError);
}

TEST(BeastTransport, CancelledBeforeSend) {
    BeastTransport transport;
    CancelToken cancel;
    cancel.cancel();

    HttpRequest request;
    request.url = "http://127.0.0.1:1/v3/info";
    EXPECT_THROW(transport.send(request, cancel), CancelledError);
}

TEST(BeastTransport, UnsupportedMethod) {
    OneShotServer server(200, "");
    BeastTransport transport;
    HttpRequest request;
    request.method = "BREW";
    request.url    = server.url("/pot");
    EXPECT_THROW(transport.send(request, CancelToken()), std::invalid_argument);
}
