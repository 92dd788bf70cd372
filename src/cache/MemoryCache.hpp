#ifndef MEMORYCACHE_HPP
#define MEMORYCACHE_HPP

#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "CacheStatistics.hpp"
#include "../config/CacheOptions.hpp"
#include "../core/SteadyClock.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/MemoryCacheInterface.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/MemoryKey.hpp"

using json = nlohmann::json;

// Bounded LRU cache with lazy TTL expiry and hit/miss accounting.
//
// Every public method takes mutex_ exactly once for its whole body and never
// calls another public method while holding it. get() counts as a write: it
// reorders the LRU list and bumps counters.
class MemoryCache : public MemoryCacheInterface {
private:
    using LruList = std::list<std::pair<MemoryKey, CacheEntry>>;

    LruList lru_list_; // front=most recent, back=least recent
    std::unordered_map<MemoryKey, LruList::iterator, MemoryKeyHash> index_;

    mutable std::mutex mutex_;
    const CacheOptions options_;
    std::shared_ptr<IClock> clock_;
    CacheStatistics stats_;

    void evictIfNeeded(); // Called by put() with the lock held
    void eraseLocked(LruList::iterator it);
    std::size_t removeExpiredLocked(TimePoint now);

public:
    explicit MemoryCache(const CacheOptions& options,
                         std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>());

    ~MemoryCache() override = default;

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    void put(const MemoryKey& key, const json& data,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    // Leaves a live entry untouched (recency included). An expired one is
    // dropped and counted as an expiration before inserting.
    bool putIfAbsent(const MemoryKey& key, const json& data,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    std::optional<json> get(const MemoryKey& key) override;
    bool remove(const MemoryKey& key) override;
    std::size_t clearForOwner(const std::string& owner) override;
    std::size_t cleanupExpired(TimePoint now) override;
    std::size_t cleanupExpired(); // Uses the injected clock
    void clearAll() override;
    std::map<MemoryKey, json> getAllEntries(
        const std::optional<std::string>& owner = std::nullopt) const override;
    CacheStats getStats() const override;

    // Diagnostic export: flat {"owner:category:subkey": data} of live entries.
    json exportEntries(const std::optional<std::string>& owner = std::nullopt) const;

    // Inspection helpers. None of them touch recency or counters.
    std::size_t size() const;
    std::size_t capacity() const { return options_.capacity; }
    const CacheOptions& options() const { return options_; }
    std::optional<std::uint64_t> accessCount(const MemoryKey& key) const;
    std::vector<MemoryKey> keysByRecency() const; // Most recent first
};

#endif // MEMORYCACHE_HPP
