#include "ExpirySweeper.hpp"

#include <stdexcept>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "../config/AppConfig.hpp"

ExpirySweeper::ExpirySweeper(net::io_context& ioc,
                             std::shared_ptr<MemoryCacheInterface> cache,
                             std::shared_ptr<IClock> clock,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client)
    : timer_(ioc),
      cache_(cache),
      clock_(clock),
      interval_(interval),
      logger_(logger),
      statsd_client_(statsd_client) {
    if (!cache_) {
        throw std::invalid_argument("Cache cannot be null for ExpirySweeper");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for ExpirySweeper");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ExpirySweeper");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for ExpirySweeper");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("ExpirySweeper interval must be positive");
    }
}

void ExpirySweeper::start() {
    if (!stopped_.exchange(false)) {
        return; // Already running
    }
    logger_->setup("ExpirySweeper started, interval " + std::to_string(interval_.count()) + "ms");
    // Arm on the timer's executor so a cancel still queued by stop() runs first.
    net::post(timer_.get_executor(), [self = shared_from_this()]() {
        if (!self->stopped_) {
            self->arm();
        }
    });
}

void ExpirySweeper::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    // Cancel on the timer's own executor; steady_timer is not thread safe.
    net::post(timer_.get_executor(), [self = shared_from_this()]() { self->timer_.cancel(); });
    logger_->debug("ExpirySweeper stop requested.");
}

void ExpirySweeper::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->onTimer(ec);
    });
}

void ExpirySweeper::onTimer(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || stopped_) {
        logger_->debug("ExpirySweeper timer cancelled.");
        return;
    }
    if (ec) {
        logger_->error("ExpirySweeper timer error: " + ec.message());
        return;
    }

    const std::size_t removed = cache_->cleanupExpired(clock_->now());
    ++sweep_count_;
    total_removed_ += removed;

    const CacheStats stats = cache_->getStats();
    if (removed > 0) {
        logger_->debug("ExpirySweeper removed " + std::to_string(removed) + " expired entries. " + stats.to_string());
        statsd_client_->increment(MetricsDefinitions::SWEEP_REMOVED, static_cast<int>(removed));
    }
    statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(stats.size));
    statsd_client_->gauge(MetricsDefinitions::CACHE_HIT_RATE, stats.hit_rate);

    arm();
}
