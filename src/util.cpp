#include "util.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <stdexcept>

namespace capi_pipeline {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(0, "/");
        }
    }

    // --- host / port ---
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty() ||
        !std::all_of(parts.port.begin(), parts.port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid URL (bad port): " + url);
    }
    return parts;
}

std::string joinUrl(const std::string& base, const std::string& path) {
    if (path.empty()) return base;

    std::string left = base;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    if (path.front() == '/') {
        return left + path;
    }
    return left + "/" + path;
}

std::string urlEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string encodeQuery(const std::map<std::string, std::string>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out.push_back('&');
        out += urlEncode(key);
        out.push_back('=');
        out += urlEncode(value);
    }
    return out;
}

std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out.push_back('&');
        out += urlEncode(key);
        out.push_back('=');
        out += urlEncode(value);
    }
    return out;
}

std::string base64Encode(const std::string& raw) {
    namespace base64 = boost::beast::detail::base64;

    std::string out(base64::encoded_size(raw.size()), '\0');
    out.resize(base64::encode(&out[0], raw.data(), raw.size()));
    return out;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::chrono::milliseconds computeBackoffMs(int attempt,
                                           std::chrono::milliseconds base,
                                           std::chrono::milliseconds max) {
    // Exponential: base * 2^attempt, clamped to max.  The shift is capped so
    // large attempt numbers cannot overflow.
    const int shift = std::min(attempt, 30);
    int64_t backoff = base.count() * (int64_t{1} << shift);
    backoff = std::min(backoff, max.count());
    backoff = std::max(backoff, base.count());

    // Jitter: uniform random in [0, 100] ms.
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng);

    return std::chrono::milliseconds(backoff);
}

} // namespace capi_pipeline
