#include "InMemoryRecordStore.hpp"

std::optional<json> InMemoryRecordStore::load(const MemoryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryRecordStore::save(const MemoryKey& key, const json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.insert_or_assign(key, record);
    return true;
}

bool InMemoryRecordStore::remove(const MemoryKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(key) > 0;
}

std::size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
