#ifndef EXPIRYSWEEPER_HPP
#define EXPIRYSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/MemoryCacheInterface.hpp"

namespace net = boost::asio;

// Periodically calls cleanupExpired() on a cache from an io_context thread.
// The cache knows nothing about it; expiry inside the cache stays lazy.
class ExpirySweeper : public std::enable_shared_from_this<ExpirySweeper> {
public:
    ExpirySweeper(net::io_context& ioc,
                  std::shared_ptr<MemoryCacheInterface> cache,
                  std::shared_ptr<IClock> clock,
                  std::chrono::milliseconds interval,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client);

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    // Must be owned by a shared_ptr before start() is called.
    void start();
    void stop();

    std::uint64_t sweepCount() const { return sweep_count_.load(); }
    std::uint64_t totalRemoved() const { return total_removed_.load(); }

private:
    void arm();
    void onTimer(const boost::system::error_code& ec);

    net::steady_timer timer_;
    std::shared_ptr<MemoryCacheInterface> cache_;
    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::atomic<bool> stopped_{true};
    std::atomic<std::uint64_t> sweep_count_{0};
    std::atomic<std::uint64_t> total_removed_{0};
};

#endif // EXPIRYSWEEPER_HPP
