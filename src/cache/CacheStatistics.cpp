#include "CacheStatistics.hpp"

void CacheStatistics::reset() {
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    expirations_ = 0;
}

CacheStats CacheStatistics::snapshot(std::size_t size, std::size_t capacity) const {
    CacheStats stats;
    stats.size = size;
    stats.capacity = capacity;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    stats.total_requests = hits_ + misses_;
    if (stats.total_requests > 0) {
        stats.hit_rate = static_cast<double>(hits_) / static_cast<double>(stats.total_requests) * 100.0;
    }
    return stats;
}
