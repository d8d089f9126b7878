/// @file fake_transport.hpp
/// In-memory HttpTransport for deterministic pipeline tests.

#pragma once

#include "errors.hpp"
#include "http_transport.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace capi_pipeline {
namespace testing_support {

inline HttpResponse jsonResponse(unsigned int status, const nlohmann::json& body,
                                 Headers headers = {}) {
    HttpResponse response;
    response.status  = status;
    response.headers = std::move(headers);
    response.headers["Content-Type"] = "application/json";
    response.body    = body.is_null() ? std::string() : body.dump();
    return response;
}

/// Answers from a FIFO of scripted responses, then from the handler, then
/// with an empty 200.  Every request is recorded.
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpResponse send(const HttpRequest& request, const CancelToken& cancel) override {
        cancel.throwIfCancelled();

        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mRequests.push_back(request);

            if (!mScript.empty()) {
                Scripted next = std::move(mScript.front());
                mScript.pop_front();
                if (!next.transportError.empty()) {
                    throw TransportError(next.transportError);
                }
                return next.response;
            }
            handler = mHandler;
        }
        if (handler) {
            return handler(request);
        }
        return jsonResponse(200, nlohmann::json::object());
    }

    void enqueue(HttpResponse response) {
        std::lock_guard<std::mutex> lock(mMutex);
        mScript.push_back(Scripted{std::move(response), ""});
    }

    void enqueueJson(unsigned int status, const nlohmann::json& body, Headers headers = {}) {
        enqueue(jsonResponse(status, body, std::move(headers)));
    }

    void enqueueTransportError(const std::string& message) {
        std::lock_guard<std::mutex> lock(mMutex);
        mScript.push_back(Scripted{HttpResponse{}, message});
    }

    /// Called (outside the lock) once the script is exhausted.
    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mMutex);
        mHandler = std::move(handler);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

    std::size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests.size();
    }

    HttpRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests.empty() ? HttpRequest{} : mRequests.back();
    }

private:
    struct Scripted {
        HttpResponse response;
        std::string  transportError;
    };

    mutable std::mutex       mMutex;
    std::deque<Scripted>     mScript;
    Handler                  mHandler;
    std::vector<HttpRequest> mRequests;
};

/// Decode an application/x-www-form-urlencoded body.
inline std::map<std::string, std::string> parseForm(const std::string& body) {
    auto decode = [](const std::string& s) {
        std::string out;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
                i += 2;
            } else if (s[i] == '+') {
                out.push_back(' ');
            } else {
                out.push_back(s[i]);
            }
        }
        return out;
    };

    std::map<std::string, std::string> fields;
    std::size_t start = 0;
    while (start <= body.size()) {
        auto end = body.find('&', start);
        if (end == std::string::npos) end = body.size();
        const std::string pair = body.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            fields[decode(pair.substr(0, eq))] =
                eq == std::string::npos ? std::string() : decode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return fields;
}

} // namespace testing_support
} // namespace capi_pipeline
