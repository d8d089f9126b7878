#pragma once

#include "logger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace capi_pipeline {

using CacheClock = std::chrono::system_clock;

/// Cached response payload.  Readable only while now < expiresAt.
struct CacheEntry {
    std::string             data;
    CacheClock::time_point  expiresAt{};
    std::string             etag;

    bool expired() const { return CacheClock::now() >= expiresAt; }
};

/// Key/value store for cached payloads.  get() throws CacheError when the
/// key is absent, expired or caching is disabled.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual CacheEntry get(const std::string& key) = 0;
    virtual void set(const std::string& key, const CacheEntry& entry) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual bool has(const std::string& key) = 0;

    /// Keys currently readable through get().
    virtual std::vector<std::string> keys() const = 0;
};

constexpr std::size_t kDefaultCacheSize = 1000;

/// Bounded in-process store with least-recently-used eviction.
/// Inserting a new key at capacity first sweeps expired entries, then
/// evicts the least recently read or written key.
///
/// With a non-zero cleanup interval a background thread purges expired
/// entries on that period.
class MemoryCache : public CacheBackend {
public:
    /// A capacity of 0 means kDefaultCacheSize.
    explicit MemoryCache(std::size_t capacity = kDefaultCacheSize,
                         std::chrono::milliseconds cleanupInterval = std::chrono::milliseconds(0));
    ~MemoryCache() override;

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    CacheEntry get(const std::string& key) override;
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;
    void clear() override;
    bool has(const std::string& key) override;

    /// Unexpired keys, most recently used first.
    std::vector<std::string> keys() const override;

    /// Purge every expired entry.  Returns how many were removed.
    std::size_t cleanup();

    std::size_t size() const;
    std::size_t capacity() const { return mCapacity; }

private:
    struct Slot {
        CacheEntry                       entry;
        std::list<std::string>::iterator position;
    };

    const std::size_t mCapacity;

    mutable std::mutex                    mMutex;
    std::list<std::string>                mRecency;   // front = most recent
    std::unordered_map<std::string, Slot> mSlots;

    std::condition_variable               mStopRequested;
    bool                                  mStopping = false;
    std::thread                           mJanitor;

    void janitorLoop(std::chrono::milliseconds interval);
    void eraseLocked(std::unordered_map<std::string, Slot>::iterator it);
    std::size_t cleanupLocked();
};

/// Backend that stores nothing; lets callers disable caching without
/// branching.
class NoOpCache : public CacheBackend {
public:
    CacheEntry get(const std::string& key) override;
    void set(const std::string&, const CacheEntry&) override {}
    void remove(const std::string&) override {}
    void clear() override {}
    bool has(const std::string&) override { return false; }
    std::vector<std::string> keys() const override { return {}; }
};

/// Ordered tiers L1..Ln.
///
/// get() probes the tiers in order; a hit in tier i > 0 is written back to
/// tiers 0..i-1 before it is returned.  set/remove/clear go to every tier;
/// if any tier fails, the last failure is rethrown after all tiers were
/// attempted.
class CacheChain : public CacheBackend {
public:
    explicit CacheChain(std::vector<std::shared_ptr<CacheBackend>> tiers,
                        std::shared_ptr<Logger> logger = nullptr);

    CacheEntry get(const std::string& key) override;
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;
    void clear() override;
    bool has(const std::string& key) override;

    /// Sorted union of every tier's keys.
    std::vector<std::string> keys() const override;

    std::size_t tierCount() const { return mTiers.size(); }

private:
    std::vector<std::shared_ptr<CacheBackend>> mTiers;
    std::shared_ptr<Logger>                    mLogger;

    template <typename Fn>
    void fanOut(Fn&& fn);
};

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

enum class CacheType { Memory, None };

/// "memory" or "none"; anything else throws ConfigError.
CacheType cacheTypeFromString(const std::string& name);

struct CacheConfig {
    CacheType                 type    = CacheType::Memory;
    std::size_t               maxSize = kDefaultCacheSize;
    std::chrono::milliseconds cleanupInterval{std::chrono::minutes(1)};
};

std::shared_ptr<CacheBackend> makeCache(const CacheConfig& config);

} // namespace capi_pipeline
