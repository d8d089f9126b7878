#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace capi_pipeline {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/v3/apps?page=2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Join a base URL ("https://api.example.com/") and a path ("/v3/apps")
/// with exactly one slash between them.
std::string joinUrl(const std::string& base, const std::string& path);

/// Percent-encode per RFC 3986 (unreserved characters pass through).
std::string urlEncode(const std::string& value);

/// "k1=v1&k2=v2" in key order.  Used for query strings and cache keys.
std::string encodeQuery(const std::map<std::string, std::string>& params);

/// application/x-www-form-urlencoded body, fields kept in the given order.
std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields);

/// Standard base64 (with padding).
std::string base64Encode(const std::string& raw);

std::string toUpper(std::string s);

bool startsWith(const std::string& s, const std::string& prefix);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [base .. max] before jitter; jitter is
/// uniform in [0, 100] ms.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           std::chrono::milliseconds base = std::chrono::milliseconds(200),
                                           std::chrono::milliseconds max  = std::chrono::milliseconds(5000));

} // namespace capi_pipeline
