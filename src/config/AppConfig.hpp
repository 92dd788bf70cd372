#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <sstream>

#include "CacheOptions.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// Names are relative to AppConfig::metrics_prefix.
namespace MetricsDefinitions {
    static std::string CACHE_HIT = "cache.hit";

    static std::string CACHE_MISS = "cache.miss";

    static std::string CACHE_SIZE = "cache.size";

    static std::string CACHE_HIT_RATE = "cache.hit_rate";

    static std::string SWEEP_REMOVED = "sweeper.removed";

    static std::string STORE_LOAD = "store.load";

    static std::string STORE_SAVE = "store.save";

    static std::string STORE_REMOVE = "store.remove";

    static std::string STORE_MISS = "store.miss";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "agent_memory_cache.config";
    static constexpr auto CONFIG_PATH_ARGUMENT = "config";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    int cache_capacity;
    int cache_default_ttl_seconds; // 0 = no default TTL
    int sweep_interval_seconds;    // 0 = no periodic sweep

    // Backing store
    bool use_redis;
    std::string redis_host;
    int redis_port;
    std::string redis_key_prefix;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    std::string metrics_prefix;
    int metrics_batch_size;

    AppConfig() {
        // --- Set Defaults  ---
        cache_capacity = 1000;
        cache_default_ttl_seconds = 3600; // 1 hour
        sweep_interval_seconds = 60;

        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        redis_key_prefix = "agent_memory";

        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_prefix = "agent_memory";
        metrics_batch_size = 20;
    }

    CacheOptions cacheOptions() const {
        CacheOptions options;
        options.capacity = static_cast<std::size_t>(cache_capacity);
        if (cache_default_ttl_seconds > 0) {
            options.default_ttl = std::chrono::seconds(cache_default_ttl_seconds);
        } else {
            options.default_ttl = std::nullopt;
        }
        return options;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_capacity: " << cache_capacity << std::endl
            << "cache_default_ttl_seconds: " << cache_default_ttl_seconds << std::endl
            << "sweep_interval_seconds: " << sweep_interval_seconds << std::endl
            << "// --- Record Store --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_key_prefix: " << redis_key_prefix << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_prefix: " << metrics_prefix << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
