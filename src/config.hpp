#pragma once

#include "cache.hpp"
#include "cache_interceptors.hpp"
#include "circuit_breaker.hpp"
#include "logger.hpp"
#include "retry.hpp"
#include "token_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>

namespace capi_pipeline {

/// Everything needed to assemble a Pipeline.  Defaults are usable as-is
/// once apiUrl and credentials are filled in.
struct PipelineConfig {
    std::string apiUrl;
    /// When set and credentials.tokenUrl is empty, the token URL is
    /// "<uaaUrl>/oauth/token".
    std::string uaaUrl;
    Credentials credentials;

    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::string               userAgent     = "capi_pipeline/1.0";
    bool                      skipTlsVerify = false;
    std::map<std::string, std::string> headers;

    LogLevel logLevel = LogLevel::Info;
    bool     verbose  = false;   // transport diagnostics on std::cerr

    bool        enableRetry = true;
    RetryConfig retry;

    int rateLimit = 0;   // requests per second, 0 = unlimited

    bool                 enableCircuitBreaker = true;
    CircuitBreakerConfig circuitBreaker;

    bool             enableCache = true;
    CacheConfig      cache;
    SmartCacheConfig smartCache = defaultSmartCacheConfig();

    bool enableMetrics = true;

    int                       batchConcurrency = 5;
    std::chrono::milliseconds batchTimeout{std::chrono::seconds(30)};

    /// Token URL after applying the uaaUrl fallback.
    std::string tokenUrl() const;
};

/// Overlay @p j on the defaults.  Unknown keys are ignored; wrong types
/// and invalid values throw ConfigError.
///
/// {
///   "api_url": "...", "uaa_url": "...", "timeout_ms": 30000,
///   "user_agent": "...", "skip_tls_verify": false, "verbose": false,
///   "log_level": "info", "headers": {"X-Name": "value"},
///   "auth": {"token_url", "client_id", "client_secret", "username",
///            "password", "refresh_token", "access_token", "scopes": [],
///            "no_auth": false},
///   "retry": {"enabled", "max_retries", "base_delay_ms", "max_delay_ms",
///             "retry_on": [429, 500, ...]},
///   "rate_limit": 10,
///   "circuit_breaker": {"enabled", "threshold", "timeout_ms",
///                       "success_threshold"},
///   "cache": {"enabled", "type", "max_size", "cleanup_interval_ms",
///             "default_ttl_ms", "ttls_ms": {"/v3/apps": 120000},
///             "conditional_requests", "invalidation"},
///   "metrics": true,
///   "batch": {"concurrency", "timeout_ms"}
/// }
PipelineConfig loadConfig(const nlohmann::json& j);

/// Parse a JSON file with loadConfig().  Throws ConfigError when the file
/// cannot be read or parsed.
PipelineConfig loadConfigFile(const std::string& path);

/// "debug", "info", "warn", "error".  Throws ConfigError otherwise.
LogLevel logLevelFromString(const std::string& name);

} // namespace capi_pipeline
