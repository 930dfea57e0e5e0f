#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {
    // Advisory lock key shared by every calibration runner
    constexpr std::int64_t kCalibrationLockKey = 0x4658434C4942;
}

class PostgresStore::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0), lock_held_(false) {
        connect();
    }

    ~Impl() {
        disconnect();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return connect_locked();
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (conn_ && conn_->is_open()) {
            conn_->close();
            spdlog::info("Disconnected from PostgreSQL database");
        }
        conn_.reset();
        lock_held_ = false;
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return conn_ && conn_->is_open();
    }

    std::vector<LabeledOutcome> fetch_labeled_outcomes(TimePoint since, std::chrono::seconds timeout) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        require_connection();

        try {
            pqxx::work txn(*conn_);

            // Bounds the fetch server-side; a stalled query is cancelled
            txn.exec("SET LOCAL statement_timeout = " +
                     std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()));

            pqxx::result result = txn.exec_params(
                "SELECT direction, confidence, outcome, win_pips, loss_pips, "
                "(EXTRACT(EPOCH FROM created_at) * 1000)::bigint AS created_ms "
                "FROM labeled_signals "
                "WHERE created_at >= to_timestamp($1::double precision / 1000.0) "
                "AND outcome IN ('WIN', 'LOSS') "
                "ORDER BY created_at",
                util::to_epoch_ms(since)
            );

            std::vector<LabeledOutcome> outcomes;
            outcomes.reserve(result.size());
            int skipped = 0;
            for (const auto& row : result) {
                auto direction = direction_from_string(row["direction"].as<std::string>());
                if (!direction || *direction == Direction::Hold || row["confidence"].is_null()) {
                    ++skipped;
                    continue;
                }

                LabeledOutcome o;
                o.direction = *direction;
                o.confidence = row["confidence"].as<double>();
                o.win = row["outcome"].as<std::string>() == "WIN";
                o.win_pips = row["win_pips"].is_null() ? 0.0 : row["win_pips"].as<double>();
                o.loss_pips = row["loss_pips"].is_null() ? 0.0 : row["loss_pips"].as<double>();
                o.created_at = util::from_epoch_ms(row["created_ms"].as<std::int64_t>());
                outcomes.push_back(o);
            }

            txn.commit();

            if (skipped > 0) {
                spdlog::warn("Skipped {} labeled signals without a usable direction or confidence", skipped);
            }
            spdlog::debug("Fetched {} labeled signals since {}", outcomes.size(), util::format_timestamp(since));
            return outcomes;
        } catch (const pqxx::query_cancelled& e) {
            throw CalibrationTimeoutError(
                fmt::format("labeled signal fetch exceeded {}s: {}", timeout.count(), e.what()));
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("PostgreSQL connection lost during fetch: {}", e.what());
            conn_.reset();
            lock_held_ = false;
            throw;
        }
    }

    bool save_calibration_record(const CalibrationRecord& record) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        require_connection();

        try {
            pqxx::work txn(*conn_);

            // Inserts only when no record with this or a later version exists
            pqxx::result inserted = txn.exec_params(
                "INSERT INTO calibration_records "
                "(version, threshold, qualified_signal_count, blended_score, win_rate, avg_pips, "
                "details, computed_at, active) "
                "SELECT $1, $2, $3, $4, $5, $6, $7::jsonb, "
                "to_timestamp($8::double precision / 1000.0), true "
                "WHERE NOT EXISTS (SELECT 1 FROM calibration_records WHERE version >= $1)",
                record.version,
                record.threshold,
                record.qualified_signal_count,
                record.blended_score,
                record.win_rate,
                record.avg_pips,
                record.details_json().dump(),
                util::to_epoch_ms(record.computed_at)
            );

            if (inserted.affected_rows() == 0) {
                txn.abort();
                spdlog::warn("Calibration record v{} not saved: a newer record exists", record.version);
                return false;
            }

            txn.exec_params(
                "UPDATE calibration_records SET active = false WHERE active AND version < $1",
                record.version
            );

            txn.commit();
            spdlog::info("Saved calibration record v{}", record.version);
            return true;
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("PostgreSQL connection lost during save: {}", e.what());
            conn_.reset();
            lock_held_ = false;
            throw;
        }
    }

    std::optional<CalibrationRecord> load_active_record() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            return std::nullopt;
        }

        try {
            pqxx::work txn(*conn_);

            pqxx::result result = txn.exec(
                "SELECT version, threshold, qualified_signal_count, blended_score, win_rate, avg_pips, "
                "details::text AS details, "
                "(EXTRACT(EPOCH FROM computed_at) * 1000)::bigint AS computed_ms "
                "FROM calibration_records "
                "WHERE active "
                "ORDER BY version DESC "
                "LIMIT 1"
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            CalibrationRecord record;
            record.version = row["version"].as<std::int64_t>();
            record.threshold = row["threshold"].as<double>();
            record.qualified_signal_count = row["qualified_signal_count"].as<int>();
            record.blended_score = row["blended_score"].as<double>();
            record.win_rate = row["win_rate"].as<double>();
            record.avg_pips = row["avg_pips"].as<double>();
            record.computed_at = util::from_epoch_ms(row["computed_ms"].as<std::int64_t>());
            if (!row["details"].is_null()) {
                record.load_details(nlohmann::json::parse(row["details"].as<std::string>()));
            }
            return record;
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("PostgreSQL connection lost loading calibration: {}", e.what());
            conn_.reset();
            lock_held_ = false;
            return std::nullopt;
        } catch (const std::exception& e) {
            spdlog::error("Error loading active calibration record: {}", e.what());
            return std::nullopt;
        }
    }

    bool try_acquire_run_lock() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        require_connection();

        // Session-level lock: released explicitly or when the connection closes
        pqxx::nontransaction txn(*conn_);
        pqxx::result result = txn.exec_params("SELECT pg_try_advisory_lock($1)", kCalibrationLockKey);
        lock_held_ = !result.empty() && result[0][0].as<bool>();
        return lock_held_;
    }

    void release_run_lock() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!lock_held_ || !conn_ || !conn_->is_open()) {
            lock_held_ = false;
            return;
        }

        pqxx::nontransaction txn(*conn_);
        txn.exec_params("SELECT pg_advisory_unlock($1)", kCalibrationLockKey);
        lock_held_ = false;
    }

private:
    bool connect_locked() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL database");
                backoff_ms_ = 1000;  // Reset backoff on successful connection
                retry_count_ = 0;
                return true;
            }
            spdlog::error("PostgreSQL connection is not open");
            conn_.reset();
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            conn_.reset();
            return false;
        }
    }

    bool ensure_connection_locked() {
        if (conn_ && conn_->is_open()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;

        if (connect_locked()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }
        spdlog::warn("PostgreSQL reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void require_connection() {
        if (!ensure_connection_locked()) {
            throw std::runtime_error("PostgreSQL unavailable");
        }
    }

    const Config& config_;
    mutable std::mutex conn_mutex_;
    std::unique_ptr<pqxx::connection> conn_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
    bool lock_held_;
};

// PostgresStore implementation using the Impl class
PostgresStore::PostgresStore(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

PostgresStore::~PostgresStore() = default;

bool PostgresStore::is_connected() const {
    return impl_->is_connected();
}

std::vector<LabeledOutcome> PostgresStore::fetch_labeled_outcomes(TimePoint since, std::chrono::seconds timeout) {
    return impl_->fetch_labeled_outcomes(since, timeout);
}

bool PostgresStore::save_calibration_record(const CalibrationRecord& record) {
    return impl_->save_calibration_record(record);
}

std::optional<CalibrationRecord> PostgresStore::load_active_record() {
    return impl_->load_active_record();
}

bool PostgresStore::try_acquire_run_lock() {
    return impl_->try_acquire_run_lock();
}

void PostgresStore::release_run_lock() {
    impl_->release_run_lock();
}
