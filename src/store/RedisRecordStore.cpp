#include <stdexcept>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "RedisRecordStore.hpp"
#include "../interfaces/ILogger.hpp"

using json = nlohmann::json;

RedisRecordStore::RedisRecordStore(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : host_(config.redis_host),
      port_(config.redis_port),
      key_prefix_(config.redis_key_prefix),
      logger_(logger),
      redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisRecordStore");
    }
    connect();
}

RedisRecordStore::~RedisRecordStore() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

void RedisRecordStore::connect() {
    redis_context_ = redisConnect(host_.c_str(), port_);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        return;
    }
    logger_->setup("RedisRecordStore connected to " + host_ + ":" + std::to_string(port_));
}

std::string RedisRecordStore::redisKey(const MemoryKey& key) const {
    return key_prefix_ + ":" + key.to_string();
}

std::optional<json> RedisRecordStore::load(const MemoryKey& key) {
    const std::string redis_key = redisKey(key);
    std::optional<std::string> raw;
    {
        std::lock_guard<std::mutex> lock(mutex_); // Ensure thread safety
        if (!redis_context_) {
            logger_->error("Redis not connected. Cannot GET key: " + redis_key);
            return std::nullopt;
        }

        redisReply* reply = static_cast<redisReply*>(
            redisCommand(redis_context_, "GET %b", redis_key.data(), redis_key.size()));
        if (reply == nullptr) {
            logger_->error("Redis GET command failed (nullptr reply) for key: " + redis_key);
            return std::nullopt;
        }
        if (reply->type == REDIS_REPLY_STRING) {
            raw = std::string(reply->str, reply->len);
        } else if (reply->type == REDIS_REPLY_ERROR) {
            logger_->error("Redis GET error for key " + redis_key + ": " + std::string(reply->str, reply->len));
        }
        freeReplyObject(reply);
    }

    if (!raw) {
        return std::nullopt;
    }
    try {
        return json::parse(*raw);
    } catch (const json::parse_error& e) {
        logger_->error("JSON parse error for key '" + redis_key + "': " + e.what());
        return std::nullopt;
    }
}

bool RedisRecordStore::save(const MemoryKey& key, const json& record) {
    const std::string redis_key = redisKey(key);
    std::string payload;
    try {
        payload = record.dump();
    } catch (const json::type_error& e) {
        logger_->error("Cannot serialize record for key '" + redis_key + "': " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_); // Ensure thread safety
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SET key: " + redis_key);
        return false;
    }

    redisReply* reply = static_cast<redisReply*>(redisCommand(redis_context_,
        "SET %b %b",
        redis_key.data(), redis_key.size(),
        payload.data(), payload.size()));
    if (reply == nullptr) {
        logger_->error("Redis SET command failed (nullptr reply) for key: " + redis_key);
        return false;
    }

    bool success = (reply->type != REDIS_REPLY_ERROR);
    if (!success) {
        logger_->error("Redis SET error for key " + redis_key + ": " + std::string(reply->str, reply->len));
    }
    freeReplyObject(reply);
    return success;
}

bool RedisRecordStore::remove(const MemoryKey& key) {
    const std::string redis_key = redisKey(key);
    std::lock_guard<std::mutex> lock(mutex_); // Ensure thread safety
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot DEL key: " + redis_key);
        return false;
    }
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(redis_context_, "DEL %b", redis_key.data(), redis_key.size()));
    if (reply == nullptr) {
        logger_->error("Redis DEL command failed (nullptr reply) for key: " + redis_key);
        return false;
    }

    bool success = (reply->type == REDIS_REPLY_INTEGER && reply->integer > 0);
    freeReplyObject(reply);
    return success;
}

bool RedisRecordStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}
