#ifndef TRACED_HPP
#define TRACED_HPP

#include <chrono>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Runs fn(), reports its duration as a StatsD timing named `operation`, and
// returns whatever fn returned. If fn throws, the failure is logged, counted
// as "<operation>.error", and the exception propagates unchanged.
template <typename Fn>
auto traced(const std::string& operation, ILogger& logger, IStatsDClient& statsd, Fn&& fn)
    -> decltype(std::forward<Fn>(fn)()) {
    using Result = decltype(std::forward<Fn>(fn)());
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    try {
        if constexpr (std::is_void_v<Result>) {
            std::forward<Fn>(fn)();
            const auto duration = elapsed();
            statsd.timing(operation, duration);
            logger.debug(operation + " completed in " + std::to_string(duration.count()) + "ms");
        } else {
            Result result = std::forward<Fn>(fn)();
            const auto duration = elapsed();
            statsd.timing(operation, duration);
            logger.debug(operation + " completed in " + std::to_string(duration.count()) + "ms");
            return result;
        }
    } catch (const std::exception& e) {
        statsd.increment(operation + ".error");
        logger.error(operation + " failed after " + std::to_string(elapsed().count()) + "ms: " + e.what());
        throw;
    }
}

#endif // TRACED_HPP
