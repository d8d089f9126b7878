#include "cache.hpp"
#include "errors.hpp"

#include <set>

namespace capi_pipeline {

// ---------------------------------------------------------------------------
// MemoryCache
// ---------------------------------------------------------------------------

MemoryCache::MemoryCache(std::size_t capacity, std::chrono::milliseconds cleanupInterval)
    : mCapacity(capacity == 0 ? kDefaultCacheSize : capacity)
{
    if (cleanupInterval.count() > 0) {
        mJanitor = std::thread(&MemoryCache::janitorLoop, this, cleanupInterval);
    }
}

MemoryCache::~MemoryCache() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mStopping = true;
    }
    mStopRequested.notify_all();
    if (mJanitor.joinable()) {
        mJanitor.join();
    }
}

void MemoryCache::janitorLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mMutex);
    while (!mStopRequested.wait_for(lock, interval, [this] { return mStopping; })) {
        cleanupLocked();
    }
}

CacheEntry MemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mMutex);

    auto it = mSlots.find(key);
    if (it == mSlots.end()) {
        throw CacheError(ErrorKind::CacheMiss, "key not found: " + key);
    }
    if (it->second.entry.expired()) {
        eraseLocked(it);
        throw CacheError(ErrorKind::CacheExpired, "entry expired: " + key);
    }

    mRecency.splice(mRecency.begin(), mRecency, it->second.position);
    return it->second.entry;
}

void MemoryCache::set(const std::string& key, const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mMutex);

    auto it = mSlots.find(key);
    if (it != mSlots.end()) {
        it->second.entry = entry;
        mRecency.splice(mRecency.begin(), mRecency, it->second.position);
        return;
    }

    if (mSlots.size() >= mCapacity) {
        cleanupLocked();
    }
    while (mSlots.size() >= mCapacity) {
        eraseLocked(mSlots.find(mRecency.back()));
    }

    mRecency.push_front(key);
    mSlots.emplace(key, Slot{entry, mRecency.begin()});
}

void MemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mSlots.find(key);
    if (it != mSlots.end()) {
        eraseLocked(it);
    }
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mSlots.clear();
    mRecency.clear();
}

bool MemoryCache::has(const std::string& key) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mSlots.find(key);
    if (it == mSlots.end()) return false;
    if (it->second.entry.expired()) {
        eraseLocked(it);
        return false;
    }
    return true;
}

std::vector<std::string> MemoryCache::keys() const {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> live;
    live.reserve(mSlots.size());
    for (const auto& key : mRecency) {
        if (!mSlots.at(key).entry.expired()) {
            live.push_back(key);
        }
    }
    return live;
}

std::size_t MemoryCache::cleanup() {
    std::lock_guard<std::mutex> lock(mMutex);
    return cleanupLocked();
}

std::size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSlots.size();
}

void MemoryCache::eraseLocked(std::unordered_map<std::string, Slot>::iterator it) {
    mRecency.erase(it->second.position);
    mSlots.erase(it);
}

std::size_t MemoryCache::cleanupLocked() {
    std::size_t removed = 0;
    for (auto it = mSlots.begin(); it != mSlots.end();) {
        if (it->second.entry.expired()) {
            mRecency.erase(it->second.position);
            it = mSlots.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ---------------------------------------------------------------------------
// NoOpCache
// ---------------------------------------------------------------------------

CacheEntry NoOpCache::get(const std::string&) {
    throw CacheError(ErrorKind::CacheDisabled, "cache disabled");
}

// ---------------------------------------------------------------------------
// CacheChain
// ---------------------------------------------------------------------------

CacheChain::CacheChain(std::vector<std::shared_ptr<CacheBackend>> tiers,
                       std::shared_ptr<Logger> logger)
    : mTiers(std::move(tiers))
    , mLogger(logger ? std::move(logger) : std::make_shared<NullLogger>()) {}

CacheEntry CacheChain::get(const std::string& key) {
    for (std::size_t i = 0; i < mTiers.size(); ++i) {
        CacheEntry entry;
        try {
            entry = mTiers[i]->get(key);
        } catch (const CacheError&) {
            continue;
        }

        // Populate the faster tiers before returning.
        for (std::size_t j = 0; j < i; ++j) {
            try {
                mTiers[j]->set(key, entry);
            } catch (const std::exception& e) {
                mLogger->warn("Cache write-back failed",
                              {{"key", key}, {"tier", std::to_string(j)}, {"error", e.what()}});
            }
        }
        return entry;
    }
    throw CacheError(ErrorKind::CacheMiss, "key not found in any cache: " + key);
}

template <typename Fn>
void CacheChain::fanOut(Fn&& fn) {
    std::exception_ptr lastError;
    for (const auto& tier : mTiers) {
        try {
            fn(*tier);
        } catch (const std::exception&) {
            lastError = std::current_exception();
        }
    }
    if (lastError) {
        std::rethrow_exception(lastError);
    }
}

void CacheChain::set(const std::string& key, const CacheEntry& entry) {
    fanOut([&](CacheBackend& tier) { tier.set(key, entry); });
}

void CacheChain::remove(const std::string& key) {
    fanOut([&](CacheBackend& tier) { tier.remove(key); });
}

void CacheChain::clear() {
    fanOut([](CacheBackend& tier) { tier.clear(); });
}

bool CacheChain::has(const std::string& key) {
    for (const auto& tier : mTiers) {
        if (tier->has(key)) return true;
    }
    return false;
}

std::vector<std::string> CacheChain::keys() const {
    std::set<std::string> merged;
    for (const auto& tier : mTiers) {
        const auto tierKeys = tier->keys();
        merged.insert(tierKeys.begin(), tierKeys.end());
    }
    return std::vector<std::string>(merged.begin(), merged.end());
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

CacheType cacheTypeFromString(const std::string& name) {
    if (name == "memory") return CacheType::Memory;
    if (name == "none")   return CacheType::None;
    throw ConfigError("unsupported cache type: " + name);
}

std::shared_ptr<CacheBackend> makeCache(const CacheConfig& config) {
    switch (config.type) {
        case CacheType::Memory:
            return std::make_shared<MemoryCache>(config.maxSize, config.cleanupInterval);
        case CacheType::None:
            return std::make_shared<NoOpCache>();
    }
    throw ConfigError("unsupported cache type");
}

} // namespace capi_pipeline
