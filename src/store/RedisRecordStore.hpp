#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/RecordStoreInterface.hpp"

using json = nlohmann::json;

// Forward declarations
struct redisContext;
class ILogger;

// One Redis string per record: "<redis_key_prefix>:<owner>:<category>:<subkey>"
// holding the record's JSON text.
class RedisRecordStore : public RecordStoreInterface {
public:
    explicit RedisRecordStore(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisRecordStore() override;

    std::optional<json> load(const MemoryKey& key) override;
    bool save(const MemoryKey& key, const json& record) override;
    bool remove(const MemoryKey& key) override;

    // Check if the store is connected to Redis
    bool isConnected() const;

private:
    void connect();
    std::string redisKey(const MemoryKey& key) const;

    std::string host_;
    int port_;
    std::string key_prefix_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;

    RedisRecordStore(const RedisRecordStore&) = delete;
    RedisRecordStore& operator=(const RedisRecordStore&) = delete;
};
