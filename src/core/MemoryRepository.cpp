#include "MemoryRepository.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../tracing/Traced.hpp"

MemoryRepository::MemoryRepository(std::shared_ptr<MemoryCacheInterface> cache,
                                   std::shared_ptr<RecordStoreInterface> store,
                                   std::shared_ptr<ILogger> logger,
                                   std::shared_ptr<IStatsDClient> statsd_client)
    : cache_(cache), store_(store), logger_(logger), statsd_client_(statsd_client) {
    if (!cache_) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!store_) {
        throw std::invalid_argument("Record store pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
}

std::optional<json> MemoryRepository::load(const MemoryKey& key) {
    // --- Check Cache ---
    if (auto cached = cache_->get(key)) {
        statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
        return cached;
    }
    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);

    // --- Fall back to the store, outside any cache lock ---
    auto record = traced(MetricsDefinitions::STORE_LOAD, *logger_, *statsd_client_,
                         [this, &key]() { return store_->load(key); });
    if (!record) {
        statsd_client_->increment(MetricsDefinitions::STORE_MISS);
        logger_->debug("No stored record for " + key.to_string());
        return std::nullopt;
    }

    if (!record->is_object()) {
        logger_->warn("Stored record for " + key.to_string() + " is not a JSON object; not caching it");
        return record;
    }
    // A save() that landed while the store read was in flight wins
    if (!cache_->putIfAbsent(key, *record)) {
        logger_->debug("Cache already refreshed for " + key.to_string() + "; keeping the newer entry");
    }
    return record;
}

bool MemoryRepository::save(const MemoryKey& key, const json& record, std::optional<std::chrono::milliseconds> ttl) {
    if (!record.is_object()) {
        throw std::invalid_argument("Record for " + key.to_string() + " must be a JSON object");
    }
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("TTL for " + key.to_string() + " must be positive");
    }

    bool saved = traced(MetricsDefinitions::STORE_SAVE, *logger_, *statsd_client_,
                        [this, &key, &record]() { return store_->save(key, record); });
    if (!saved) {
        logger_->error("Record store rejected write for " + key.to_string() + "; cache left unchanged");
        return false;
    }
    cache_->put(key, record, ttl);
    return true;
}

bool MemoryRepository::forget(const MemoryKey& key) {
    bool stored = traced(MetricsDefinitions::STORE_REMOVE, *logger_, *statsd_client_,
                         [this, &key]() { return store_->remove(key); });
    bool cached = cache_->remove(key);
    return stored || cached;
}
