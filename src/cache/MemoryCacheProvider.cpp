#include "MemoryCacheProvider.hpp"

#include <stdexcept>

// Define static members
std::mutex MemoryCacheProvider::mutex_;
std::shared_ptr<MemoryCache> MemoryCacheProvider::instance_ = nullptr;

std::shared_ptr<MemoryCache> MemoryCacheProvider::getInstance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        instance_ = std::make_shared<MemoryCache>(CacheOptions{});
    }
    return instance_;
}

std::shared_ptr<MemoryCache> MemoryCacheProvider::getInstance(const CacheOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        instance_ = std::make_shared<MemoryCache>(options);
        return instance_;
    }
    if (instance_->options() != options) {
        throw std::logic_error("Shared MemoryCache already configured with " + instance_->options().to_string() +
                               ", requested " + options.to_string());
    }
    return instance_;
}

bool MemoryCacheProvider::hasInstance() {
    std::lock_guard<std::mutex> lock(mutex_);
    return instance_ != nullptr;
}

void MemoryCacheProvider::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    instance_.reset();
}
