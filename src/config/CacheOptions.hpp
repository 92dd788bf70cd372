#ifndef CACHEOPTIONS_HPP
#define CACHEOPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

// Construction-time settings of a MemoryCache.
struct CacheOptions {
    std::size_t capacity = 1000;
    // Applied when put() gets no TTL override. nullopt = entries never expire.
    std::optional<std::chrono::milliseconds> default_ttl = std::chrono::seconds(3600);

    bool operator==(const CacheOptions& other) const {
        return capacity == other.capacity && default_ttl == other.default_ttl;
    }
    bool operator!=(const CacheOptions& other) const { return !(*this == other); }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "{capacity: " << capacity << ", default_ttl: ";
        if (default_ttl) {
            oss << default_ttl->count() << "ms";
        } else {
            oss << "none";
        }
        oss << "}";
        return oss.str();
    }
};

#endif // CACHEOPTIONS_HPP
