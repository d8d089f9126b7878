#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace capi_pipeline {

/// Case-insensitive ordering for HTTP header names.
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) {
                return std::tolower(x) < std::tolower(y);
            });
    }
};

using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// Wire-level request handed to an HttpTransport.
struct HttpRequest {
    std::string method = "GET";
    std::string url;              // absolute, including any query string
    Headers     headers;
    std::string body;
};

/// Wire-level response returned by an HttpTransport.
struct HttpResponse {
    unsigned int status = 0;
    Headers      headers;
    std::string  body;
};

} // namespace capi_pipeline
