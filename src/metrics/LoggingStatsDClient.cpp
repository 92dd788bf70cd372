#include <sstream>
#include <stdexcept>

#include "LoggingStatsDClient.hpp"

LoggingStatsDClient::LoggingStatsDClient(std::shared_ptr<ILogger> logger) : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggingStatsDClient");
    }
}

void LoggingStatsDClient::record(const std::string& line) {
    if (logger_->isDebugEnabled()) {
        logger_->debug("metric " + line);
    }
}

void LoggingStatsDClient::increment(const std::string& key, int value) {
    record(key + ":" + std::to_string(value) + "|c");
}

void LoggingStatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void LoggingStatsDClient::gauge(const std::string& key, double value) {
    std::ostringstream oss;
    oss << key << ":" << value << "|g";
    record(oss.str());
}

void LoggingStatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    record(key + ":" + std::to_string(value.count()) + "|ms");
}

void LoggingStatsDClient::set(const std::string& key, const std::string& value) {
    record(key + ":" + value + "|s");
}
