#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// --- Point-in-time view of a MemoryCache ---
struct CacheStats {
    std::size_t size = 0;
    std::size_t capacity = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    double hit_rate = 0.0; // Percent, 0 when there were no lookups
    std::uint64_t total_requests = 0;

    json toJson() const {
        return json{
            {"size", size},
            {"max_size", capacity},
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"expirations", expirations},
            {"hit_rate_percent", std::round(hit_rate * 100.0) / 100.0},
            {"total_requests", total_requests}
        };
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats { size: " << size << "/" << capacity
            << ", hits: " << hits
            << ", misses: " << misses
            << ", hit_rate: " << hit_rate << "%"
            << ", evictions: " << evictions
            << ", expirations: " << expirations << " }";
        return oss.str();
    }
};

#endif // CACHESTATS_HPP
