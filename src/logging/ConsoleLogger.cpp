#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

// Everything goes to stderr: stdout carries command replies.
void ConsoleLogger::write(const std::string& prefix, const std::string& message) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_now{};
    localtime_r(&now, &tm_now);

    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cerr << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%S") << ' ' << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        write(LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        write(LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        write(LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        write(LogUtils::CERROR_LOG_PREFIX, message);
    }
}

// Setup messages always go out, whatever the level
void ConsoleLogger::setup(const std::string& message) {
    write(LogUtils::SETUP_LOG_PREFIX, message);
}
