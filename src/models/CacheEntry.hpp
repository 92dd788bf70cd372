#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <chrono>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#include "../interfaces/IClock.hpp"

using json = nlohmann::json;

struct CacheEntry {
    json data;                                   // The cached record (always a JSON object)
    TimePoint created_at;                        // Reset on every put
    std::optional<std::chrono::milliseconds> ttl; // nullopt = never expires
    std::uint64_t access_count = 0;

    CacheEntry(json entry_data, TimePoint created, std::optional<std::chrono::milliseconds> entry_ttl)
        : data(std::move(entry_data)), created_at(created), ttl(entry_ttl) {}

    // Strictly older than the TTL counts as expired; age == ttl is still fresh.
    bool isExpired(TimePoint now) const {
        return ttl.has_value() && (now - created_at) > *ttl;
    }

    void touch() { ++access_count; }
};

#endif // CACHEENTRY_HPP
