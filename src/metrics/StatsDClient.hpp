#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// StatsD over UDP. Lines are buffered and sent newline-joined once
// batch_size of them are pending, on flush(), and on destruction.
class StatsDClient : public IStatsDClient {
public:
    // endpoint is "<host>:<port>"; throws std::runtime_error when it is malformed
    // or cannot be resolved.
    StatsDClient(const std::string& endpoint,
                 const std::string& prefix,
                 std::size_t batch_size,
                 std::shared_ptr<ILogger> logger);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;
    void flush() override;

private:
    void send(const std::string& message);
    void sendBatchLocked();

    std::shared_ptr<ILogger> logger_;
    std::string prefix_;
    std::size_t batch_size_;

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint endpoint_;

    std::mutex mutex_;
    std::vector<std::string> pending_;

    // Delete copy and move operations
    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
