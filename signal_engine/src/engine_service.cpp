#include "engine_service.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>

using json = nlohmann::json;

EngineService::EngineService(const Config& config)
    : config_(config), calibration_store_(default_calibration(config_)) {

    // Initialize components
    redis_bus_ = std::make_unique<RedisBus>(config_);
    pg_store_ = std::make_unique<PostgresStore>(config_);
    pipeline_ = std::make_unique<SignalPipeline>(config_, calibration_store_);
    calibration_job_ = std::make_unique<CalibrationJob>(config_, *pg_store_, calibration_store_);

    health_server_ = std::make_unique<HealthServer>(
        config_,
        [this]() { return redis_bus_->is_connected(); },
        [this]() { return pg_store_->is_connected(); },
        calibration_store_
    );
}

EngineService::~EngineService() {
    stop();
}

void EngineService::run() {
    if (running_) {
        spdlog::warn("Signal engine is already running");
        return;
    }

    running_ = true;

    // Pick up a record persisted by an earlier run before serving requests
    reload_calibration();

    redis_bus_->subscribe_signal_requests([this](const SignalRequest& request) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            request_queue_.push(request);
        }
        queue_cv_.notify_one();
    });

    worker_thread_ = std::thread(&EngineService::worker_thread_func, this);
    scheduler_thread_ = std::thread(&EngineService::scheduler_thread_func, this);
    health_server_->start();

    spdlog::info("Signal engine started");
}

void EngineService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Stop Redis subscriptions
    redis_bus_->stop_subscribers();

    // Notify worker and scheduler to exit
    queue_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
    }
    scheduler_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }

    health_server_->stop();

    spdlog::info("Signal engine stopped");
}

void EngineService::worker_thread_func() {
    spdlog::info("Signal worker thread started");

    while (running_) {
        SignalRequest request;

        // Get next request from queue
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::seconds(1), [this] {
                return !running_ || !request_queue_.empty();
            });

            if (!running_) {
                break;
            }
            if (request_queue_.empty()) {
                continue;
            }

            request = std::move(request_queue_.front());
            request_queue_.pop();
        }

        process_request(request);
    }

    spdlog::info("Signal worker thread stopped");
}

void EngineService::process_request(const SignalRequest& request) {
    try {
        SignalRecord record = pipeline_->evaluate(request);
        if (!redis_bus_->publish_signal(record)) {
            spdlog::error("Failed to publish signal for {} ({})", request.symbol, request.corr_id);
        }
    } catch (const InsufficientDataError& e) {
        spdlog::warn("Skipping {} ({}): {}", request.symbol, request.corr_id, e.what());
        json error = {
            {"error", "insufficient_data"},
            {"series", e.series()},
            {"required", e.required()},
            {"actual", e.actual()}
        };
        redis_bus_->publish_error(request.corr_id, request.symbol, error);
    } catch (const std::exception& e) {
        spdlog::error("Error evaluating {} ({}): {}", request.symbol, request.corr_id, e.what());
        json error = {
            {"error", "evaluation_failed"},
            {"message", e.what()}
        };
        redis_bus_->publish_error(request.corr_id, request.symbol, error);
    }
}

void EngineService::reload_calibration() {
    auto record = pg_store_->load_active_record();
    if (!record) {
        return;
    }

    std::int64_t version = record->version;
    double threshold = record->threshold;
    if (calibration_store_.publish(std::move(*record))) {
        spdlog::info("Loaded calibration v{}: threshold {:.0f}", version, threshold);
    }
}

void EngineService::scheduler_thread_func() {
    spdlog::info("Calibration scheduler started (every {} minutes)", config_.calibration.schedule_interval_minutes);

    const auto reload_interval = std::chrono::seconds(config_.calibration.reload_interval_seconds);
    const auto calibration_interval = std::chrono::minutes(config_.calibration.schedule_interval_minutes);

    auto next_reload = std::chrono::steady_clock::now() + reload_interval;
    auto next_calibration = std::chrono::steady_clock::now() + calibration_interval;

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(scheduler_mutex_);
            scheduler_cv_.wait_until(lock, std::min(next_reload, next_calibration), [this] {
                return !running_.load();
            });
        }
        if (!running_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_calibration) {
            CalibrationRunResult result = calibration_job_->run(std::chrono::system_clock::now());
            spdlog::info("Scheduled calibration finished: {} ({})", to_string(result.status), result.message);
            next_calibration = now + calibration_interval;
        }
        if (now >= next_reload) {
            reload_calibration();
            next_reload = now + reload_interval;
        }
    }

    spdlog::info("Calibration scheduler stopped");
}
