#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "../interfaces/RecordStoreInterface.hpp"
#include "../models/MemoryKey.hpp"

using json = nlohmann::json;

// Process-local record store, used when Redis is disabled or unreachable.
// Nothing survives a restart.
class InMemoryRecordStore : public RecordStoreInterface {
public:
    std::optional<json> load(const MemoryKey& key) override;
    bool save(const MemoryKey& key, const json& record) override;
    bool remove(const MemoryKey& key) override;

    std::size_t size() const;

private:
    std::map<MemoryKey, json> records_;
    mutable std::mutex mutex_;
};
