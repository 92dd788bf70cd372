#ifndef CACHESTATISTICS_HPP
#define CACHESTATISTICS_HPP

#include <cstddef>
#include <cstdint>

#include "../models/CacheStats.hpp"

// Hit/miss accounting for MemoryCache. Not synchronized on its own: every
// call happens under the owning cache's mutex.
class CacheStatistics {
public:
    void recordHit() { ++hits_; }
    void recordMiss() { ++misses_; }
    void recordEviction() { ++evictions_; }
    void recordExpirations(std::size_t count) { expirations_ += count; }
    void reset();

    std::uint64_t hits() const { return hits_; }
    std::uint64_t misses() const { return misses_; }

    CacheStats snapshot(std::size_t size, std::size_t capacity) const;

private:
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t evictions_ = 0;
    std::uint64_t expirations_ = 0;
};

#endif // CACHESTATISTICS_HPP
