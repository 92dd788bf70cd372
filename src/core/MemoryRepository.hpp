#ifndef MEMORYREPOSITORY_HPP
#define MEMORYREPOSITORY_HPP

#include <chrono>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/MemoryCacheInterface.hpp"
#include "../interfaces/RecordStoreInterface.hpp"
#include "../models/MemoryKey.hpp"

using json = nlohmann::json;

// Cache-aside access to agent memories.
//
// Reads consult the cache first and fall back to the record store, then
// populate the cache. Writes go to the store first and only reach the cache
// once the store accepted them. The cache itself never sees the store.
//
// The store read in load() runs without any lock held. Its result fills the
// cache with putIfAbsent, so a concurrent save() that already refreshed the
// cache is never overwritten by the older record. A forget() that completes
// between the store read and the fill is not covered: the removed record is
// cached again and served until it expires or is evicted.
class MemoryRepository {
public:
    MemoryRepository(std::shared_ptr<MemoryCacheInterface> cache,
                     std::shared_ptr<RecordStoreInterface> store,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<IStatsDClient> statsd_client);

    MemoryRepository(const MemoryRepository&) = delete;
    MemoryRepository& operator=(const MemoryRepository&) = delete;

    std::optional<json> load(const MemoryKey& key);
    bool save(const MemoryKey& key, const json& record,
              std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    // Drops the record from store and cache. True if either held it.
    bool forget(const MemoryKey& key);

private:
    std::shared_ptr<MemoryCacheInterface> cache_;
    std::shared_ptr<RecordStoreInterface> store_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // MEMORYREPOSITORY_HPP
