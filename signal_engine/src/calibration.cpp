#include "calibration.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    constexpr double kScoreEpsilon = 1e-9;

    double pips_of(const LabeledOutcome& o) {
        return o.win ? o.win_pips : -o.loss_pips;
    }

    // Releases the repository run lock on scope exit
    class RunLockGuard {
    public:
        explicit RunLockGuard(CalibrationRepository& repository) : repository_(repository) {}
        ~RunLockGuard() {
            try {
                repository_.release_run_lock();
            } catch (const std::exception& e) {
                spdlog::error("Failed to release calibration run lock: {}", e.what());
            }
        }

        RunLockGuard(const RunLockGuard&) = delete;
        RunLockGuard& operator=(const RunLockGuard&) = delete;

    private:
        CalibrationRepository& repository_;
    };
}

ThresholdCalibrator::ThresholdCalibrator(const Config& config) : config_(config) {}

std::vector<int> ThresholdCalibrator::grid() const {
    const auto& c = config_.calibration;
    std::vector<int> thresholds;
    for (int t = c.grid_min; t <= c.grid_max; t += c.grid_step) {
        thresholds.push_back(t);
    }
    return thresholds;
}

ThresholdScore ThresholdCalibrator::score_threshold(const std::vector<LabeledOutcome>& outcomes,
                                                    int threshold) const {
    ThresholdScore s;
    s.threshold = threshold;

    int wins = 0;
    double pips = 0.0;
    for (const auto& o : outcomes) {
        if (o.confidence < threshold) {
            continue;
        }
        ++s.qualified;
        if (o.win) {
            ++wins;
        }
        pips += pips_of(o);
    }

    if (s.qualified > 0) {
        s.win_rate = 100.0 * wins / s.qualified;
        s.avg_pips = pips / s.qualified;
        s.score = s.win_rate * config_.calibration.winrate_weight + s.avg_pips * config_.calibration.pips_weight;
    }
    return s;
}

DirectionStats ThresholdCalibrator::direction_stats(const std::vector<LabeledOutcome>& outcomes, int threshold,
                                                    Direction direction) const {
    DirectionStats stats;
    double pips = 0.0;
    for (const auto& o : outcomes) {
        if (o.direction != direction || o.confidence < threshold) {
            continue;
        }
        ++stats.count;
        if (o.win) {
            ++stats.wins;
        }
        pips += pips_of(o);
    }
    if (stats.count > 0) {
        stats.win_rate = 100.0 * stats.wins / stats.count;
        stats.avg_pips = pips / stats.count;
    }
    return stats;
}

CalibrationRecord ThresholdCalibrator::calibrate(const std::vector<LabeledOutcome>& outcomes, TimePoint now) const {
    const auto& c = config_.calibration;
    const TimePoint since = now - std::chrono::hours(24) * c.window_days;

    std::vector<LabeledOutcome> window;
    window.reserve(outcomes.size());
    for (const auto& o : outcomes) {
        if (o.created_at >= since && o.created_at <= now && std::isfinite(o.confidence)) {
            window.push_back(o);
        }
    }

    if (window.size() < static_cast<std::size_t>(c.min_samples)) {
        throw CalibrationInsufficientDataError(fmt::format(
            "insufficient data: {} labeled signals in the last {} days, need {}", window.size(), c.window_days,
            c.min_samples));
    }

    std::vector<ThresholdScore> eligible;
    std::optional<ThresholdScore> best;
    for (int threshold : grid()) {
        ThresholdScore s = score_threshold(window, threshold);
        if (s.qualified < c.min_qualified) {
            spdlog::debug("Threshold {}: only {} qualified, skipped", threshold, s.qualified);
            continue;
        }
        spdlog::debug("Threshold {}: {} qualified, win rate {:.1f}%, avg pips {:.2f}, score {:.2f}",
                      threshold, s.qualified, s.win_rate, s.avg_pips, s.score);
        eligible.push_back(s);

        // Higher score wins; ties go to the larger sample, then the lower threshold
        if (!best || s.score > best->score + kScoreEpsilon ||
            (std::abs(s.score - best->score) <= kScoreEpsilon && s.qualified > best->qualified)) {
            best = s;
        }
    }

    if (!best) {
        throw CalibrationInsufficientDataError(fmt::format(
            "insufficient data: no threshold has {} qualifying signals", c.min_qualified));
    }

    CalibrationRecord record;
    record.version = util::to_epoch_ms(now);
    record.threshold = best->threshold;
    record.qualified_signal_count = best->qualified;
    record.blended_score = best->score;
    record.win_rate = best->win_rate;
    record.avg_pips = best->avg_pips;
    record.sample_count = static_cast<int>(window.size());
    record.buy = direction_stats(window, best->threshold, Direction::Buy);
    record.sell = direction_stats(window, best->threshold, Direction::Sell);
    record.grid = std::move(eligible);
    record.computed_at = now;
    return record;
}

CalibrationStore::CalibrationStore(CalibrationRecord initial)
    : current_(std::make_shared<const CalibrationRecord>(std::move(initial))) {}

std::shared_ptr<const CalibrationRecord> CalibrationStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool CalibrationStore::publish(CalibrationRecord record) {
    auto next = std::make_shared<const CalibrationRecord>(std::move(record));
    std::lock_guard<std::mutex> lock(mutex_);
    if (next->version <= current_->version) {
        return false;
    }
    current_ = std::move(next);
    return true;
}

CalibrationRecord default_calibration(const Config& config) {
    CalibrationRecord record;
    record.version = 0;
    record.threshold = config.calibration.default_threshold;
    record.computed_at = util::from_epoch_ms(0);
    return record;
}

std::string to_string(CalibrationStatus status) {
    switch (status) {
        case CalibrationStatus::Published: return "PUBLISHED";
        case CalibrationStatus::InsufficientData: return "INSUFFICIENT_DATA";
        case CalibrationStatus::TimedOut: return "TIMED_OUT";
        case CalibrationStatus::Failed: return "FAILED";
        case CalibrationStatus::AlreadyRunning: return "ALREADY_RUNNING";
    }
    return "FAILED";
}

CalibrationJob::CalibrationJob(const Config& config, CalibrationRepository& repository, CalibrationStore& store)
    : config_(config), repository_(repository), store_(store), calibrator_(config) {}

CalibrationRunResult CalibrationJob::run(TimePoint now) {
    CalibrationRunResult result;

    std::unique_lock<std::mutex> local(run_mutex_, std::try_to_lock);
    if (!local.owns_lock()) {
        result.status = CalibrationStatus::AlreadyRunning;
        result.message = "calibration already running in this process";
        spdlog::warn("Calibration skipped: {}", result.message);
        return result;
    }

    try {
        if (!repository_.try_acquire_run_lock()) {
            result.status = CalibrationStatus::AlreadyRunning;
            result.message = "calibration run lock held by another process";
            spdlog::warn("Calibration skipped: {}", result.message);
            return result;
        }
    } catch (const std::exception& e) {
        result.status = CalibrationStatus::Failed;
        result.message = fmt::format("could not acquire run lock: {}", e.what());
        spdlog::error("Calibration failed: {}", result.message);
        return result;
    }
    RunLockGuard guard(repository_);

    const auto& c = config_.calibration;
    try {
        auto since = now - std::chrono::hours(24) * c.window_days;
        spdlog::info("Calibration started: window {} days since {}", c.window_days, util::format_timestamp(since));

        auto outcomes = repository_.fetch_labeled_outcomes(since, std::chrono::seconds(c.fetch_timeout_seconds));
        CalibrationRecord record = calibrator_.calibrate(outcomes, now);

        const std::int64_t active_version = store_.snapshot()->version;
        if (record.version <= active_version) {
            result.status = CalibrationStatus::Failed;
            result.message = fmt::format("record v{} is not newer than the active record v{}", record.version,
                                         active_version);
            spdlog::error("Calibration failed, keeping previous threshold: {}", result.message);
            return result;
        }

        if (!repository_.save_calibration_record(record)) {
            result.status = CalibrationStatus::Failed;
            result.message = fmt::format("record v{} superseded by a newer stored record", record.version);
            spdlog::error("Calibration failed, keeping previous threshold: {}", result.message);
            return result;
        }
        if (!store_.publish(record)) {
            // A newer record arrived while saving; the next reload picks up whichever is active
            result.status = CalibrationStatus::Failed;
            result.message = fmt::format("record v{} overtaken before publish", record.version);
            spdlog::error("Calibration failed: {}", result.message);
            return result;
        }

        spdlog::info("Calibration published v{}: threshold {:.0f}, {} qualified, score {:.2f}",
                     record.version, record.threshold, record.qualified_signal_count, record.blended_score);
        result.status = CalibrationStatus::Published;
        result.message = fmt::format("threshold {:.0f}", record.threshold);
        result.record = std::move(record);
    } catch (const CalibrationInsufficientDataError& e) {
        result.status = CalibrationStatus::InsufficientData;
        result.message = e.what();
        spdlog::warn("Calibration skipped: {}", result.message);
    } catch (const CalibrationTimeoutError& e) {
        result.status = CalibrationStatus::TimedOut;
        result.message = e.what();
        spdlog::warn("Calibration timed out, keeping previous threshold: {}", result.message);
    } catch (const std::exception& e) {
        result.status = CalibrationStatus::Failed;
        result.message = e.what();
        spdlog::error("Calibration failed, keeping previous threshold: {}", result.message);
    }
    return result;
}
