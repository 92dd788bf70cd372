#include "MemoryCache.hpp"

#include <iterator>
#include <stdexcept>

using namespace std::chrono;

MemoryCache::MemoryCache(const CacheOptions& options, std::shared_ptr<IClock> clock)
    : options_(options), clock_(std::move(clock)) {
    if (options_.capacity == 0) {
        throw std::invalid_argument("MemoryCache capacity must be positive");
    }
    if (options_.default_ttl && options_.default_ttl->count() <= 0) {
        throw std::invalid_argument("MemoryCache default TTL must be positive when set");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for MemoryCache");
    }
}

void MemoryCache::put(const MemoryKey& key, const json& data, std::optional<milliseconds> ttl) {
    if (!data.is_object()) {
        throw std::invalid_argument("Cached data for " + key.to_string() + " must be a JSON object");
    }
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("TTL override for " + key.to_string() + " must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<milliseconds> effective_ttl = ttl ? ttl : options_.default_ttl;
    CacheEntry entry(data, clock_->now(), effective_ttl);

    // --- LRU Logic ---
    auto index_it = index_.find(key);
    if (index_it != index_.end()) {
        // Refresh in place and move to the front
        index_it->second->second = std::move(entry);
        lru_list_.splice(lru_list_.begin(), lru_list_, index_it->second);
        return;
    }

    // New key: make room first so size never exceeds capacity
    evictIfNeeded();
    lru_list_.emplace_front(key, std::move(entry));
    index_.emplace(key, lru_list_.begin());
    // --- End LRU Logic ---
}

bool MemoryCache::putIfAbsent(const MemoryKey& key, const json& data, std::optional<milliseconds> ttl) {
    if (!data.is_object()) {
        throw std::invalid_argument("Cached data for " + key.to_string() + " must be a JSON object");
    }
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("TTL override for " + key.to_string() + " must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_->now();
    auto index_it = index_.find(key);
    if (index_it != index_.end()) {
        if (!index_it->second->second.isExpired(now)) {
            return false;
        }
        eraseLocked(index_it->second);
        stats_.recordExpirations(1);
    }

    evictIfNeeded();
    lru_list_.emplace_front(key, CacheEntry(data, now, ttl ? ttl : options_.default_ttl));
    index_.emplace(key, lru_list_.begin());
    return true;
}

std::optional<json> MemoryCache::get(const MemoryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        stats_.recordMiss();
        return std::nullopt;
    }

    CacheEntry& entry = index_it->second->second;
    if (entry.isExpired(clock_->now())) {
        eraseLocked(index_it->second);
        stats_.recordExpirations(1);
        stats_.recordMiss();
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, index_it->second);
    entry.touch();
    stats_.recordHit();
    return entry.data;
}

bool MemoryCache::remove(const MemoryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return false;
    }
    eraseLocked(index_it->second);
    return true;
}

std::size_t MemoryCache::clearForOwner(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
        auto next = std::next(it);
        if (it->first.owner() == owner) {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    return removed;
}

std::size_t MemoryCache::cleanupExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return removeExpiredLocked(now);
}

std::size_t MemoryCache::cleanupExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return removeExpiredLocked(clock_->now());
}

void MemoryCache::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    lru_list_.clear();
    stats_.reset();
}

std::map<MemoryKey, json> MemoryCache::getAllEntries(const std::optional<std::string>& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = clock_->now();
    std::map<MemoryKey, json> result;
    for (const auto& [key, entry] : lru_list_) {
        if (owner && key.owner() != *owner) {
            continue;
        }
        if (!entry.isExpired(now)) {
            result.emplace(key, entry.data);
        }
    }
    return result;
}

CacheStats MemoryCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.snapshot(index_.size(), options_.capacity);
}

json MemoryCache::exportEntries(const std::optional<std::string>& owner) const {
    // Snapshot first, render after the lock is released
    const auto entries = getAllEntries(owner);
    json exported = json::object();
    for (const auto& [key, data] : entries) {
        exported[key.to_string()] = data;
    }
    return exported;
}

std::size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

std::optional<std::uint64_t> MemoryCache::accessCount(const MemoryKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return std::nullopt;
    }
    return index_it->second->second.access_count;
}

std::vector<MemoryKey> MemoryCache::keysByRecency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryKey> keys;
    keys.reserve(lru_list_.size());
    for (const auto& item : lru_list_) {
        keys.push_back(item.first);
    }
    return keys;
}

// Private helper to enforce size limit
void MemoryCache::evictIfNeeded() {
    // No lock needed here as put() and putIfAbsent() already hold it
    while (index_.size() >= options_.capacity && !lru_list_.empty()) {
        eraseLocked(std::prev(lru_list_.end())); // Least recently used
        stats_.recordEviction();
    }
}

void MemoryCache::eraseLocked(LruList::iterator it) {
    index_.erase(it->first);
    lru_list_.erase(it);
}

std::size_t MemoryCache::removeExpiredLocked(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
        auto next = std::next(it);
        if (it->second.isExpired(now)) {
            eraseLocked(it);
            ++removed;
        }
        it = next;
    }
    stats_.recordExpirations(removed);
    return removed;
}
