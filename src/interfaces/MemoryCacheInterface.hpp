#ifndef MEMORYCACHEINTERFACE_HPP
#define MEMORYCACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "IClock.hpp"
#include "../models/CacheStats.hpp"
#include "../models/MemoryKey.hpp"

using json = nlohmann::json;

class MemoryCacheInterface {
public:
    virtual ~MemoryCacheInterface() = default;
    virtual void put(const MemoryKey& key, const json& data,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;
    // Inserts only when no live entry exists for key. True if inserted.
    virtual bool putIfAbsent(const MemoryKey& key, const json& data,
                             std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;
    virtual std::optional<json> get(const MemoryKey& key) = 0;
    virtual bool remove(const MemoryKey& key) = 0;
    virtual std::size_t clearForOwner(const std::string& owner) = 0;
    virtual std::size_t cleanupExpired(TimePoint now) = 0;
    virtual void clearAll() = 0;
    virtual std::map<MemoryKey, json> getAllEntries(
        const std::optional<std::string>& owner = std::nullopt) const = 0;
    virtual CacheStats getStats() const = 0;
};

#endif // MEMORYCACHEINTERFACE_HPP
