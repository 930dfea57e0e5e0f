#pragma once

#include "calibration.hpp"
#include "config.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

// PostgreSQL repository for labeled outcomes and calibration records
class PostgresStore : public CalibrationRepository {
public:
    explicit PostgresStore(const Config& config);
    ~PostgresStore() override;

    // Reachability for the health endpoint
    bool is_connected() const;

    // CalibrationRepository
    std::vector<LabeledOutcome> fetch_labeled_outcomes(TimePoint since, std::chrono::seconds timeout) override;
    bool save_calibration_record(const CalibrationRecord& record) override;
    std::optional<CalibrationRecord> load_active_record() override;
    bool try_acquire_run_lock() override;
    void release_run_lock() override;

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
