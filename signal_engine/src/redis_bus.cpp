#include "redis_bus.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iterator>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace {
    using Attrs = std::vector<std::pair<std::string, std::string>>;
    using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
    using ItemStream = std::vector<Item>;
}

class RedisBus::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), running_(false), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        stop_subscribers();
        disconnect();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return connect_locked();
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return is_connected_locked();
    }

    void subscribe_signal_requests(std::function<void(const SignalRequest&)> callback) {
        if (request_thread_.joinable()) {
            spdlog::warn("Signal request subscriber already running");
            return;
        }

        running_ = true;
        request_thread_ = std::thread([this, callback]() {
            spdlog::info("Starting signal request subscriber on {}", config_.stream_requests);

            sw::redis::ConnectionOptions opts;
            opts.uri = config_.redis_url;
            opts.socket_timeout = std::chrono::milliseconds(3000);

            sw::redis::Redis redis(opts);

            // Create a consumer group if it doesn't exist
            try {
                redis.xgroup_create(config_.stream_requests, config_.consumer_group, "0", true);
            } catch (const sw::redis::Error& e) {
                spdlog::debug("Consumer group already exists or error: {}", e.what());
            }

            std::string consumer_id = config_.service_name + "_" +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

            int error_backoff_ms = 1000;
            while (running_) {
                try {
                    std::unordered_map<std::string, ItemStream> result;
                    redis.xreadgroup(config_.consumer_group, consumer_id, config_.stream_requests, ">",
                                     std::chrono::milliseconds(1000), 10,
                                     std::inserter(result, result.end()));
                    error_backoff_ms = 1000;

                    for (const auto& stream : result) {
                        for (const auto& entry : stream.second) {
                            handle_entry(redis, entry, callback);
                        }
                    }
                } catch (const sw::redis::Error& e) {
                    spdlog::error("Error in signal request subscriber: {}", e.what());
                    std::this_thread::sleep_for(std::chrono::milliseconds(error_backoff_ms));
                    error_backoff_ms = std::min(error_backoff_ms * 2, 30000);
                }
            }

            spdlog::info("Signal request subscriber stopped");
        });
    }

    void stop_subscribers() {
        running_ = false;

        if (request_thread_.joinable()) {
            request_thread_.join();
        }
    }

    bool publish_signal(const SignalRecord& record) {
        std::unordered_map<std::string, std::string> fields = {
            {"data", record.to_json().dump()},
            {"corr_id", record.corr_id},
            {"symbol", record.symbol},
            {"as_of", util::format_timestamp(record.as_of)}
        };
        return publish(fields, "signal");
    }

    bool publish_error(const std::string& corr_id, const std::string& symbol, const json& error) {
        json j = error;
        j["corr_id"] = corr_id;
        j["symbol"] = symbol;

        std::unordered_map<std::string, std::string> fields = {
            {"data", j.dump()},
            {"corr_id", corr_id},
            {"symbol", symbol}
        };
        return publish(fields, "error record");
    }

private:
    bool connect_locked() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;  // Reset backoff on successful connection
            retry_count_ = 0;
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    bool is_connected_locked() const {
        if (!redis_) return false;

        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

    bool ensure_connection_locked() {
        if (is_connected_locked()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;

        if (connect_locked()) {
            spdlog::info("Redis connection restored");
            return true;
        }
        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void handle_entry(sw::redis::Redis& redis, const Item& entry,
                      const std::function<void(const SignalRequest&)>& callback) {
        const auto& id = entry.first;
        try {
            if (entry.second) {
                for (const auto& field : *entry.second) {
                    if (field.first != "data") {
                        continue;
                    }
                    auto request = SignalRequest::from_json(json::parse(field.second));
                    if (request) {
                        callback(*request);
                    } else {
                        spdlog::warn("Dropping malformed signal request {}", id);
                    }
                }
            }
        } catch (const json::exception& e) {
            spdlog::error("Error parsing signal request {}: {}", id, e.what());
        }

        // Acknowledge the message
        try {
            redis.xack(config_.stream_requests, config_.consumer_group, id);
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to acknowledge {}: {}", id, e.what());
        }
    }

    bool publish(const std::unordered_map<std::string, std::string>& fields, const char* what) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            spdlog::error("Cannot publish {}: Redis unavailable", what);
            return false;
        }

        try {
            redis_->xadd(config_.stream_signals, "*", fields.begin(), fields.end());
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish {}: {}", what, e.what());
            return false;
        }
    }

    const Config& config_;
    mutable std::mutex conn_mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread request_thread_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

// RedisBus implementation using the Impl class
RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::is_connected() const {
    return impl_->is_connected();
}

void RedisBus::subscribe_signal_requests(std::function<void(const SignalRequest&)> callback) {
    impl_->subscribe_signal_requests(std::move(callback));
}

void RedisBus::stop_subscribers() {
    impl_->stop_subscribers();
}

bool RedisBus::publish_signal(const SignalRecord& record) {
    return impl_->publish_signal(record);
}

bool RedisBus::publish_error(const std::string& corr_id, const std::string& symbol, const json& error) {
    return impl_->publish_error(corr_id, symbol, error);
}
