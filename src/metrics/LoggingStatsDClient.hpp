#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Fallback when no STATSD_SERVER is configured: metrics become debug log lines.
class LoggingStatsDClient : public IStatsDClient {
public:
    explicit LoggingStatsDClient(std::shared_ptr<ILogger> logger);
    ~LoggingStatsDClient() override = default;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

private:
    void record(const std::string& line);

    std::shared_ptr<ILogger> logger_;
};
