#include "config.hpp"
#include "engine_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

namespace {
    void init_logging() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("signal_engine", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::set_level(spdlog::level::info);
        spdlog::flush_on(spdlog::level::info);
    }

    void log_startup_summary(const Config& config) {
        spdlog::info("Requests: {} (group {}), records: {}", config.stream_requests, config.consumer_group,
                     config.stream_signals);
        spdlog::info("Regime: trend ADX > {:.0f} with CHOP < {:.0f}, range CHOP > {:.1f}",
                     config.regime.adx_trend_threshold, config.regime.choppiness_trend_max,
                     config.regime.choppiness_range_threshold);
        spdlog::info("Calibration: default threshold {:.0f}, every {} min over {} days",
                     config.calibration.default_threshold, config.calibration.schedule_interval_minutes,
                     config.calibration.window_days);
    }
}

int main(int argc, char* argv[]) {
    init_logging();
    spdlog::info("Starting FX Signal Engine...");

    // argv[1] wins over CONFIG_PATH
    std::string config_path = argc > 1 ? argv[1] : util::get_env_var("CONFIG_PATH", "config.json");

    Config config;
    try {
        config.load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded from {}", config_path);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }
    log_startup_summary(config);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<EngineService> service;
    try {
        service = std::make_unique<EngineService>(config);
        service->run();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start the signal engine: {}", e.what());
        return 1;
    }

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received, draining requests...");
    service->stop();

    spdlog::info("FX Signal Engine stopped.");
    spdlog::shutdown();
    return 0;
}
