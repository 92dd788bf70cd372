#include <cstdint>
#include <sstream>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include "StatsDClient.hpp"

using boost::asio::ip::udp;

StatsDClient::StatsDClient(
    const std::string& statsd_address,
    const std::string& prefix,
    std::size_t batch_size,
    std::shared_ptr<ILogger> logger)
    : logger_(logger), prefix_(prefix), batch_size_(batch_size == 0 ? 1 : batch_size), socket_(io_context_) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host_ = statsd_address.substr(0, colon_pos);
    if (host_ == "localhost") {
        host_ = "127.0.0.1";
    }
    std::string port_ = statsd_address.substr(colon_pos + 1);
    try {
        std::size_t pos = 0;
        int port = std::stoi(port_, &pos);
        if (pos != port_.size() || port <= 0 || port > 65535) {
            throw std::out_of_range(port_);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    boost::system::error_code ec;
    udp::resolver resolver(io_context_);
    auto results = resolver.resolve(udp::v4(), host_, port_, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Cannot resolve StatsD host " + host_ + ": " + ec.message());
    }
    endpoint_ = results.begin()->endpoint();

    socket_.open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD socket: " + ec.message());
    }
    logger_->setup("StatsDClient sending to " + endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port()));
}

StatsDClient::~StatsDClient() {
    flush();
    boost::system::error_code ec;
    socket_.close(ec);
}

void StatsDClient::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(prefix_.empty() ? message : prefix_ + "." + message);
    if (pending_.size() >= batch_size_) {
        sendBatchLocked();
    }
}

void StatsDClient::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    sendBatchLocked();
}

void StatsDClient::sendBatchLocked() {
    if (pending_.empty()) {
        return;
    }
    std::string payload;
    for (const auto& line : pending_) {
        if (!payload.empty()) {
            payload += '\n';
        }
        payload += line;
    }
    pending_.clear();

    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(payload), endpoint_, 0, ec);
    if (ec) {
        // Metrics are best effort; a lost batch is only logged
        logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
    }
}

// Increment a counter
void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

// Decrement a counter
void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

// Record a gauge value
void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

// Record a timing value
void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

// Record a set value
void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
