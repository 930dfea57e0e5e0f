#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, Probe redis_probe, Probe postgres_probe, const CalibrationStore& calibration)
        : config_(config),
          redis_probe_(std::move(redis_probe)),
          postgres_probe_(std::move(postgres_probe)),
          calibration_(calibration),
          running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();

            bool redis_healthy = redis_probe_ && redis_probe_();
            bool postgres_healthy = postgres_probe_ && postgres_probe_();
            health_status["components"]["redis"] = redis_healthy ? "healthy" : "unhealthy";
            health_status["components"]["postgres"] = postgres_healthy ? "healthy" : "unhealthy";

            auto active = calibration_.snapshot();
            health_status["calibration"]["version"] = active->version;
            health_status["calibration"]["threshold"] = active->threshold;

            // Postgres only feeds calibration; requests are still served without it
            if (!redis_healthy) {
                health_status["status"] = "unhealthy";
                res.status = 503;
            } else {
                if (!postgres_healthy) {
                    health_status["status"] = "degraded";
                }
                res.status = 200;
            }

            res.set_content(health_status.dump(2), "application/json");
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}",
                              config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    Probe redis_probe_;
    Probe postgres_probe_;
    const CalibrationStore& calibration_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, Probe redis_probe, Probe postgres_probe,
                           const CalibrationStore& calibration)
    : pImpl_(std::make_unique<Impl>(config, std::move(redis_probe), std::move(postgres_probe), calibration)) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
