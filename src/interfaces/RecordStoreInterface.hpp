#ifndef RECORDSTOREINTERFACE_HPP
#define RECORDSTOREINTERFACE_HPP

#include <optional>

#include <nlohmann/json.hpp>

#include "../models/MemoryKey.hpp"

using json = nlohmann::json;

// Durable record store the cache sits in front of. MemoryCache never calls
// it; MemoryRepository does, around the cache.
class RecordStoreInterface {
public:
    virtual ~RecordStoreInterface() = default;
    virtual std::optional<json> load(const MemoryKey& key) = 0;
    virtual bool save(const MemoryKey& key, const json& record) = 0;
    virtual bool remove(const MemoryKey& key) = 0;
};

#endif // RECORDSTOREINTERFACE_HPP
