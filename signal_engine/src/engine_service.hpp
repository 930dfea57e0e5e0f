#pragma once

#include "calibration.hpp"
#include "config.hpp"
#include "health.hpp"
#include "pg_store.hpp"
#include "redis_bus.hpp"
#include "signal_pipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

class EngineService {
public:
    explicit EngineService(const Config& config);
    ~EngineService();

    // Start the service
    void run();

    // Stop the service
    void stop();

private:
    // Evaluates queued requests
    void worker_thread_func();

    // Reloads the active calibration and runs the calibration job on schedule
    void scheduler_thread_func();

    void process_request(const SignalRequest& request);
    void reload_calibration();

    // Configuration
    Config config_;

    // Service components
    CalibrationStore calibration_store_;
    std::unique_ptr<RedisBus> redis_bus_;
    std::unique_ptr<PostgresStore> pg_store_;
    std::unique_ptr<SignalPipeline> pipeline_;
    std::unique_ptr<CalibrationJob> calibration_job_;
    std::unique_ptr<HealthServer> health_server_;

    // Thread management
    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    std::thread scheduler_thread_;

    // Request queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<SignalRequest> request_queue_;

    // Wakes the scheduler on shutdown
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;
};
