#pragma once

#include "config.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Selects the confidence threshold that maximizes the blended
// win-rate/average-pips score over the trailing window.
class ThresholdCalibrator {
public:
    explicit ThresholdCalibrator(const Config& config);

    std::vector<int> grid() const;

    ThresholdScore score_threshold(const std::vector<LabeledOutcome>& outcomes, int threshold) const;
    DirectionStats direction_stats(const std::vector<LabeledOutcome>& outcomes, int threshold,
                                   Direction direction) const;

    // Throws CalibrationInsufficientDataError below the sample minimum or when
    // no threshold qualifies enough signals
    CalibrationRecord calibrate(const std::vector<LabeledOutcome>& outcomes, TimePoint now) const;

private:
    const Config& config_;
};

// Holds the active record. Readers take one snapshot per request; publish swaps it whole.
class CalibrationStore {
public:
    explicit CalibrationStore(CalibrationRecord initial);

    std::shared_ptr<const CalibrationRecord> snapshot() const;

    // Rejects records that are not newer than the active one
    bool publish(CalibrationRecord record);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const CalibrationRecord> current_;
};

// Record in force before any calibration has run
CalibrationRecord default_calibration(const Config& config);

// Historical outcomes and persisted records
class CalibrationRepository {
public:
    virtual ~CalibrationRepository() = default;

    // Throws CalibrationTimeoutError when the fetch exceeds timeout
    virtual std::vector<LabeledOutcome> fetch_labeled_outcomes(TimePoint since, std::chrono::seconds timeout) = 0;

    // Supersedes the active record atomically. Returns false, leaving the stored
    // records untouched, when one with the same or a newer version exists.
    virtual bool save_calibration_record(const CalibrationRecord& record) = 0;

    virtual std::optional<CalibrationRecord> load_active_record() = 0;

    // Cross-process guard so two runs never overlap
    virtual bool try_acquire_run_lock() = 0;
    virtual void release_run_lock() = 0;
};

enum class CalibrationStatus { Published, InsufficientData, TimedOut, Failed, AlreadyRunning };

std::string to_string(CalibrationStatus status);

struct CalibrationRunResult {
    CalibrationStatus status = CalibrationStatus::Failed;
    std::optional<CalibrationRecord> record;
    std::string message;
};

// One non-overlapping calibration run: fetch, select, persist, publish.
// The previous record stays active on every failure path.
class CalibrationJob {
public:
    CalibrationJob(const Config& config, CalibrationRepository& repository, CalibrationStore& store);

    CalibrationRunResult run(TimePoint now);

private:
    const Config& config_;
    CalibrationRepository& repository_;
    CalibrationStore& store_;
    ThresholdCalibrator calibrator_;
    std::mutex run_mutex_;
};
