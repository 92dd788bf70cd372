#ifndef MEMORYCACHEPROVIDER_HPP
#define MEMORYCACHEPROVIDER_HPP

#include <memory>
#include <mutex>

#include "MemoryCache.hpp"
#include "../config/CacheOptions.hpp"

// Process-wide MemoryCache for code that cannot have one injected.
//
// The first getInstance() call fixes the options. Asking again with different
// options throws std::logic_error instead of silently handing back a cache
// configured by someone else. reset() drops the shared instance so tests can
// start from a clean cache; existing shared_ptr holders keep their copy.
class MemoryCacheProvider {
public:
    static std::shared_ptr<MemoryCache> getInstance();
    static std::shared_ptr<MemoryCache> getInstance(const CacheOptions& options);
    static bool hasInstance();
    static void reset();

    MemoryCacheProvider() = delete;

private:
    static std::mutex mutex_;
    static std::shared_ptr<MemoryCache> instance_;
};

#endif // MEMORYCACHEPROVIDER_HPP
