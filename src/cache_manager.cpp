#include "cache_manager.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>

namespace capi_pipeline {

CacheManager::CacheManager(std::shared_ptr<CacheBackend> backend, CacheManagerOptions options)
    : mBackend(backend ? std::move(backend) : std::make_shared<NoOpCache>())
    , mOptions(options) {}

std::string CacheManager::getCacheKey(const std::string& method, const std::string& path,
                                      const QueryParams& params) {
    std::string key = toUpper(method) + ":" + path;
    if (!params.empty()) {
        key += ":" + encodeQuery(params);
    }
    return key;
}

void CacheManager::set(const std::string& key, const std::string& data,
                       std::optional<std::chrono::milliseconds> ttl) {
    setWithETag(key, data, "", ttl);
}

void CacheManager::setWithETag(const std::string& key, const std::string& data,
                               const std::string& etag,
                               std::optional<std::chrono::milliseconds> ttl) {
    CacheEntry entry;
    entry.data      = data;
    entry.etag      = etag;
    entry.expiresAt = CacheClock::now() + ttl.value_or(mOptions.defaultTtl);

    mBackend->set(key, entry);
    ++mSets;
}

std::string CacheManager::get(const std::string& key) {
    try {
        std::string data = mBackend->get(key).data;
        ++mHits;
        return data;
    } catch (const CacheError&) {
        ++mMisses;
        throw;
    }
}

std::optional<CacheEntry> CacheManager::getEntry(const std::string& key) {
    try {
        return mBackend->get(key);
    } catch (const CacheError&) {
        return std::nullopt;
    }
}

void CacheManager::remove(const std::string& key) {
    mBackend->remove(key);
}

void CacheManager::clear() {
    mBackend->clear();
}

std::vector<std::string> CacheManager::keys() const {
    return mBackend->keys();
}

CacheStats CacheManager::getStats() const {
    CacheStats stats;
    stats.hits   = mHits.load();
    stats.misses = mMisses.load();
    stats.sets   = mSets.load();
    return stats;
}

// ---------------------------------------------------------------------------
// CachingPolicy
// ---------------------------------------------------------------------------

bool pathHasPrefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return false;
    if (path == prefix) return true;
    if (!startsWith(path, prefix)) return false;
    return prefix.back() == '/' || path[prefix.size()] == '/';
}

bool CachingPolicy::allowsRequest(const std::string& method, const std::string& path) const {
    const std::string verb = toUpper(method);
    if (verb == "GET") {
        if (!cacheGet) return false;
    } else if (verb == "POST") {
        if (!cachePost) return false;
    } else {
        return false;
    }

    auto matches = [&path](const std::string& prefix) { return pathHasPrefix(path, prefix); };

    if (std::any_of(excludePaths.begin(), excludePaths.end(), matches)) {
        return false;
    }
    if (!includePaths.empty()) {
        return std::any_of(includePaths.begin(), includePaths.end(), matches);
    }
    return true;
}

bool CachingPolicy::shouldCache(const std::string& method, const std::string& path,
                                unsigned int status) const {
    if (!allowsRequest(method, path)) return false;
    if (status >= 200 && status < 300) return true;
    return cacheErrors;
}

} // namespace capi_pipeline
