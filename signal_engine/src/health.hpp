#pragma once

#include "calibration.hpp"
#include "config.hpp"
#include <functional>
#include <memory>

// Serves GET /health on its own thread
class HealthServer {
public:
    using Probe = std::function<bool()>;

    HealthServer(const Config& config, Probe redis_probe, Probe postgres_probe, const CalibrationStore& calibration);
    ~HealthServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
