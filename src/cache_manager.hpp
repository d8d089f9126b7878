#pragma once

#include "cache.hpp"
#include "request.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capi_pipeline {

struct CacheStats {
    int64_t hits   = 0;
    int64_t misses = 0;
    int64_t sets   = 0;

    /// hits / (hits + misses), 0 when nothing was read.
    double hitRate() const {
        const int64_t reads = hits + misses;
        return reads == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(reads);
    }
};

struct CacheManagerOptions {
    std::chrono::milliseconds defaultTtl{std::chrono::minutes(5)};
};

/// Front end over a CacheBackend: builds keys, applies TTLs and counts
/// hits.
class CacheManager {
public:
    /// A null backend disables caching (NoOpCache).
    explicit CacheManager(std::shared_ptr<CacheBackend> backend,
                          CacheManagerOptions options = CacheManagerOptions());

    /// "GET:/v3/apps" or "GET:/v3/apps:page=1&per_page=50".
    static std::string getCacheKey(const std::string& method, const std::string& path,
                                   const QueryParams& params = QueryParams());

    /// Store @p data for @p ttl (the default TTL when omitted).
    void set(const std::string& key, const std::string& data,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    void setWithETag(const std::string& key, const std::string& data, const std::string& etag,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /// Payload for @p key.  Counts a hit, or a miss before rethrowing the
    /// backend's CacheError.
    std::string get(const std::string& key);

    /// Full entry without touching the hit/miss counters.
    std::optional<CacheEntry> getEntry(const std::string& key);

    void remove(const std::string& key);
    void clear();

    /// Keys the backend currently holds.  Evicted and expired entries are
    /// not listed, so the result is bounded by the backend's capacity.
    std::vector<std::string> keys() const;

    CacheStats getStats() const;

    const CacheManagerOptions& options() const { return mOptions; }

private:
    std::shared_ptr<CacheBackend> mBackend;
    CacheManagerOptions           mOptions;

    std::atomic<int64_t> mHits{0};
    std::atomic<int64_t> mMisses{0};
    std::atomic<int64_t> mSets{0};
};

/// Decides which responses are cacheable.  By default successful GETs are
/// cached everywhere except the volatile job and deployment collections.
struct CachingPolicy {
    bool cacheGet    = true;
    bool cachePost   = false;
    bool cacheErrors = false;

    /// Path prefixes never cached.
    std::vector<std::string> excludePaths{"/v3/jobs", "/v3/deployments"};
    /// When non-empty, only these path prefixes are cached.
    std::vector<std::string> includePaths;

    /// Method and path checks only.
    bool allowsRequest(const std::string& method, const std::string& path) const;

    bool shouldCache(const std::string& method, const std::string& path,
                     unsigned int status) const;
};

/// True when @p path is @p prefix or lies beneath it ("/v3/jobs/abc" is
/// under "/v3/jobs"; "/v3/jobsx" is not).
bool pathHasPrefix(const std::string& path, const std::string& prefix);

} // namespace capi_pipeline
