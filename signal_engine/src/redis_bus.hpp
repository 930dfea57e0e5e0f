#pragma once

#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class RedisBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus();

    // Reachability for the health endpoint
    bool is_connected() const;

    // Consumes the request stream through the configured consumer group.
    // Malformed entries are logged and acknowledged.
    void subscribe_signal_requests(std::function<void(const SignalRequest&)> callback);
    void stop_subscribers();

    // Publishing methods
    bool publish_signal(const SignalRecord& record);
    bool publish_error(const std::string& corr_id, const std::string& symbol, const nlohmann::json& error);

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
