#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <fstream>

namespace capi_pipeline {

std::string PipelineConfig::tokenUrl() const {
    if (!credentials.tokenUrl.empty() || uaaUrl.empty()) {
        return credentials.tokenUrl;
    }
    return uaaTokenUrl(uaaUrl);
}

LogLevel logLevelFromString(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw ConfigError("unknown log level: " + name);
}

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

void readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j[key].is_null()) {
        const auto ms = j[key].get<int64_t>();
        if (ms < 0) {
            throw ConfigError(std::string(key) + " must not be negative");
        }
        out = std::chrono::milliseconds(ms);
    }
}

void readAuth(const nlohmann::json& j, Credentials& creds) {
    readField(j, "token_url", creds.tokenUrl);
    readField(j, "client_id", creds.clientId);
    readField(j, "client_secret", creds.clientSecret);
    readField(j, "username", creds.username);
    readField(j, "password", creds.password);
    readField(j, "refresh_token", creds.refreshToken);
    readField(j, "access_token", creds.accessToken);
    readField(j, "scopes", creds.scopes);
    readField(j, "no_auth", creds.noAuth);
}

void readRetry(const nlohmann::json& j, PipelineConfig& cfg) {
    readField(j, "enabled", cfg.enableRetry);

    int  maxRetries = cfg.retry.maxRetries();
    auto baseDelay  = cfg.retry.baseDelay();
    auto maxDelay   = cfg.retry.maxDelay();
    auto codes      = cfg.retry.retryOnCodes();

    readField(j, "max_retries", maxRetries);
    readMillis(j, "base_delay_ms", baseDelay);
    readMillis(j, "max_delay_ms", maxDelay);
    readField(j, "retry_on", codes);

    if (maxRetries < 0) {
        throw ConfigError("retry.max_retries must not be negative");
    }
    cfg.retry = RetryConfig(maxRetries, baseDelay, maxDelay, std::move(codes));
}

void readCircuitBreaker(const nlohmann::json& j, PipelineConfig& cfg) {
    readField(j, "enabled", cfg.enableCircuitBreaker);
    readField(j, "threshold", cfg.circuitBreaker.threshold);
    readMillis(j, "timeout_ms", cfg.circuitBreaker.timeout);
    readField(j, "success_threshold", cfg.circuitBreaker.successThreshold);

    if (cfg.circuitBreaker.threshold <= 0 || cfg.circuitBreaker.successThreshold <= 0) {
        throw ConfigError("circuit_breaker thresholds must be positive");
    }
}

void readCache(const nlohmann::json& j, PipelineConfig& cfg) {
    readField(j, "enabled", cfg.enableCache);
    if (j.contains("type")) {
        cfg.cache.type = cacheTypeFromString(j["type"].get<std::string>());
    }
    readField(j, "max_size", cfg.cache.maxSize);
    readMillis(j, "cleanup_interval_ms", cfg.cache.cleanupInterval);
    readMillis(j, "default_ttl_ms", cfg.smartCache.ttls.defaultTtl);
    if (j.contains("ttls_ms")) {
        for (const auto& [prefix, ms] : j["ttls_ms"].items()) {
            cfg.smartCache.ttls.byPrefix[prefix] = std::chrono::milliseconds(ms.get<int64_t>());
        }
    }
    readField(j, "conditional_requests", cfg.smartCache.enableConditionalRequests);
    readField(j, "invalidation", cfg.smartCache.enableSmartInvalidation);
}

} // namespace

PipelineConfig loadConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    PipelineConfig cfg;
    try {
        readField(j, "api_url", cfg.apiUrl);
        readField(j, "uaa_url", cfg.uaaUrl);
        readMillis(j, "timeout_ms", cfg.timeout);
        readField(j, "user_agent", cfg.userAgent);
        readField(j, "skip_tls_verify", cfg.skipTlsVerify);
        readField(j, "verbose", cfg.verbose);
        readField(j, "headers", cfg.headers);
        if (j.contains("log_level")) {
            cfg.logLevel = logLevelFromString(j["log_level"].get<std::string>());
        }

        if (j.contains("auth"))            readAuth(j["auth"], cfg.credentials);
        if (j.contains("retry"))           readRetry(j["retry"], cfg);
        if (j.contains("circuit_breaker")) readCircuitBreaker(j["circuit_breaker"], cfg);
        if (j.contains("cache"))           readCache(j["cache"], cfg);

        readField(j, "rate_limit", cfg.rateLimit);
        readField(j, "metrics", cfg.enableMetrics);

        if (j.contains("batch")) {
            readField(j["batch"], "concurrency", cfg.batchConcurrency);
            readMillis(j["batch"], "timeout_ms", cfg.batchTimeout);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    if (cfg.rateLimit < 0) {
        throw ConfigError("rate_limit must not be negative");
    }
    if (!cfg.apiUrl.empty()) {
        try {
            parseUrl(cfg.apiUrl);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("invalid api_url: ") + e.what());
        }
    }
    return cfg;
}

PipelineConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse config file " + path + ": " + e.what());
    }
    return loadConfig(j);
}

} // namespace capi_pipeline
