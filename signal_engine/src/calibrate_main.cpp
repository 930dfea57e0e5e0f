#include "calibration.hpp"
#include "config.hpp"
#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <memory>

// One-shot calibration run, for cron or manual use.
// Exit codes: 0 published, 2 insufficient data, 3 timed out, 4 already running, 1 otherwise.
int main(int argc, char* argv[]) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("signal_calibrate", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path = util::get_env_var("CONFIG_PATH", "config.json");
    if (argc > 1) {
        config_path = argv[1];
    }

    Config config;
    try {
        config.load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    PostgresStore store(config);

    CalibrationStore active(default_calibration(config));
    if (auto record = store.load_active_record()) {
        spdlog::info("Current calibration v{}: threshold {:.0f}", record->version, record->threshold);
        active.publish(std::move(*record));
    }

    CalibrationJob job(config, store, active);
    CalibrationRunResult result = job.run(std::chrono::system_clock::now());

    spdlog::info("Calibration {}: {}", to_string(result.status), result.message);
    if (result.record) {
        spdlog::info("{}", result.record->to_json().dump());
    }
    spdlog::shutdown();

    switch (result.status) {
        case CalibrationStatus::Published: return 0;
        case CalibrationStatus::InsufficientData: return 2;
        case CalibrationStatus::TimedOut: return 3;
        case CalibrationStatus::AlreadyRunning: return 4;
        case CalibrationStatus::Failed: return 1;
    }
    return 1;
}
