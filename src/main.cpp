#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

#include <boost/asio/executor_work_guard.hpp> // For make_work_guard
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp> // For graceful shutdown

#include "cache/ExpirySweeper.hpp"
#include "cache/MemoryCache.hpp"
#include "cache/MemoryCacheProvider.hpp"
#include "config/AppConfig.hpp"
#include "core/CommandProcessor.hpp"
#include "core/MemoryRepository.hpp"
#include "core/SteadyClock.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/LoggingStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/InMemoryRecordStore.hpp"
#include "store/RedisRecordStore.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize the Record Store ---
std::shared_ptr<RecordStoreInterface> initializeRecordStore(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_store = std::make_shared<RedisRecordStore>(config_, logger_);
        if (redis_store->isConnected()) {
            logger_->setup("Redis record store connected successfully.");
            return redis_store;
        }
        logger_->error("Redis unavailable; records will not outlive this process.");
    }
    logger_->setup("Creating InMemoryRecordStore.");
    return std::make_shared<InMemoryRecordStore>();
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (!statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
        try {
            return std::make_shared<StatsDClient>(statsd_server_endpoint, config.metrics_prefix,
                                                  static_cast<std::size_t>(config.metrics_batch_size), logger_);
        } catch (const std::exception& e) {
            logger_->error("StatsDClient failed to get created: " + std::string(e.what()));
        }
    }

    logger_->setup("Metrics will be written to the debug log.");
    return std::make_shared<LoggingStatsDClient>(logger_);
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<RecordStoreInterface> record_store = initializeRecordStore(config_, logger_);

        std::shared_ptr<MemoryCache> cache = MemoryCacheProvider::getInstance(config_.cacheOptions());
        logger_->setup("MemoryCache created with options " + cache->options().to_string());

        auto repository = std::make_shared<MemoryRepository>(cache, record_store, logger_, statsd_client);
        CommandProcessor processor(repository, cache, logger_);

        // --- Background io_context: expiry sweeper and signal handling ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        std::shared_ptr<ExpirySweeper> sweeper;
        if (config_.sweep_interval_seconds > 0) {
            sweeper = std::make_shared<ExpirySweeper>(ioc, cache, std::make_shared<SteadyClock>(),
                                                      std::chrono::seconds(config_.sweep_interval_seconds),
                                                      logger_, statsd_client);
            sweeper->start();
        } else {
            logger_->setup("Periodic expiry sweep disabled; expiry is checked on access and on SWEEP.");
        }

        // A signal only requests shutdown; the command loop below unwinds
        // through the normal shutdown path.
        std::atomic<bool> shutdown_requested{false};
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&shutdown_requested, logger_](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
            shutdown_requested = true;
        });

        // The io_context thread blocks SIGINT/SIGTERM, so they land on the main
        // thread and interrupt its blocking read of stdin.
        sigset_t shutdown_signals;
        sigemptyset(&shutdown_signals);
        sigaddset(&shutdown_signals, SIGINT);
        sigaddset(&shutdown_signals, SIGTERM);
        sigset_t previous_mask;
        pthread_sigmask(SIG_BLOCK, &shutdown_signals, &previous_mask);
        std::thread ioc_thread([&ioc, logger_]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                logger_->error("Exception in io_context thread: " + std::string(e.what()));
            }
            logger_->debug("io_context thread exiting.");
        });
        pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);

        // --- Command loop ---
        logger_->setup("Ready. Type HELP for commands.");
        const std::size_t answered = processor.serve(std::cin, std::cout, shutdown_requested);
        logger_->debug("Answered " + std::to_string(answered) + " commands.");

        logger_->setup("Final " + cache->getStats().to_string());
        if (sweeper) {
            sweeper->stop();
        }
        signals.cancel();
        work_guard.reset();
        ioc.stop();
        if (ioc_thread.joinable()) {
            ioc_thread.join();
        }
        statsd_client->flush();
        logger_->setup("Shut down cleanly.");
        return 0;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
