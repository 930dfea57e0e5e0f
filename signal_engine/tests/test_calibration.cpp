/**
 * Threshold calibrator and calibration job tests
 */

#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <future>

#include "../src/calibration.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;

namespace {
    const TimePoint kNow = util::parse_iso8601("2025-06-01T00:00:00Z");

    void add(std::vector<LabeledOutcome>& out, int count, double confidence, bool win, double pips,
             Direction direction = Direction::Buy) {
        for (int i = 0; i < count; ++i) {
            out.push_back(outcome(direction, confidence, win, pips, kNow - std::chrono::hours(1 + i)));
        }
    }

    // 75 dominates: C and D together score 100 x 0.6 + 16.5 x 0.4, ahead of 80 with D alone
    std::vector<LabeledOutcome> dominance_dataset() {
        std::vector<LabeledOutcome> out;
        add(out, 60, 60.0, false, 10.0);                   // A
        add(out, 30, 70.0, true, 15.0);                    // B wins
        add(out, 30, 70.0, false, 10.0, Direction::Sell);  // B losses
        add(out, 40, 77.0, true, 20.0);                    // C
        add(out, 12, 82.0, true, 5.0, Direction::Sell);    // D
        return out;
    }
}

// ============================================================================
// Threshold selection
// ============================================================================

void test_grid_and_scoring() {
    std::cout << "  Testing grid and threshold scoring..." << std::endl;

    Config config;
    ThresholdCalibrator calibrator(config);

    auto grid = calibrator.grid();
    assert(grid.size() == 10);
    assert(grid.front() == 50);
    assert(grid.back() == 95);

    std::vector<LabeledOutcome> outcomes;
    add(outcomes, 3, 70.0, true, 10.0);
    add(outcomes, 1, 70.0, false, 20.0);
    add(outcomes, 5, 40.0, true, 50.0);

    auto s = calibrator.score_threshold(outcomes, 60);
    assert(s.qualified == 4);
    assert(near(s.win_rate, 75.0));
    assert(near(s.avg_pips, (30.0 - 20.0) / 4.0));
    assert(near(s.score, 75.0 * 0.6 + 2.5 * 0.4));

    auto empty = calibrator.score_threshold(outcomes, 90);
    assert(empty.qualified == 0);
    assert(empty.score == 0.0);

    std::cout << "  Grid and scoring: PASSED" << std::endl;
}

void test_dominant_threshold() {
    std::cout << "  Testing dominant threshold selection..." << std::endl;

    Config config;
    ThresholdCalibrator calibrator(config);

    auto outcomes = dominance_dataset();
    auto record = calibrator.calibrate(outcomes, kNow);
    assert(record.threshold == 75.0);
    assert(record.qualified_signal_count == 52);
    assert(record.sample_count == 172);
    assert(record.version == util::to_epoch_ms(kNow));
    assert(record.computed_at == kNow);

    // Breakdown at the chosen threshold
    assert(record.buy.count == 40);
    assert(record.buy.wins == 40);
    assert(record.sell.count == 12);
    assert(near(record.sell.avg_pips, 5.0));

    // Thresholds with fewer than 10 qualifying signals are left out of the grid
    for (const auto& entry : record.grid) {
        assert(entry.qualified >= config.calibration.min_qualified);
        assert(entry.score <= record.blended_score + 1e-9);
    }
    assert(record.grid.size() == 7);

    std::cout << "  Dominant threshold: PASSED" << std::endl;
}

void test_tie_break() {
    std::cout << "  Testing tie break on sample size..." << std::endl;

    Config config;
    ThresholdCalibrator calibrator(config);

    // Every threshold scores 64; 50 through 70 share the larger sample and the lowest wins
    std::vector<LabeledOutcome> outcomes;
    add(outcomes, 100, 40.0, false, 10.0);
    add(outcomes, 20, 70.0, true, 10.0);
    add(outcomes, 20, 90.0, true, 10.0);

    auto record = calibrator.calibrate(outcomes, kNow);
    assert(record.threshold == 50.0);
    assert(record.qualified_signal_count == 40);

    std::cout << "  Tie break: PASSED" << std::endl;
}

void test_insufficient_data() {
    std::cout << "  Testing insufficient calibration data..." << std::endl;

    Config config;
    ThresholdCalibrator calibrator(config);

    std::vector<LabeledOutcome> outcomes;
    add(outcomes, 99, 80.0, true, 10.0);
    bool thrown = false;
    try {
        calibrator.calibrate(outcomes, kNow);
    } catch (const CalibrationInsufficientDataError&) {
        thrown = true;
    }
    assert(thrown);

    // Old outcomes fall outside the window
    outcomes.clear();
    for (int i = 0; i < 150; ++i) {
        outcomes.push_back(outcome(Direction::Buy, 80.0, true, 10.0, kNow - std::chrono::hours(24 * 120)));
    }
    thrown = false;
    try {
        calibrator.calibrate(outcomes, kNow);
    } catch (const CalibrationInsufficientDataError&) {
        thrown = true;
    }
    assert(thrown);

    // Enough samples but every confidence sits under the grid
    outcomes.clear();
    add(outcomes, 120, 30.0, true, 10.0);
    thrown = false;
    try {
        calibrator.calibrate(outcomes, kNow);
    } catch (const CalibrationInsufficientDataError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  Insufficient data: PASSED" << std::endl;
}

// ============================================================================
// Job
// ============================================================================

void test_job_publishes() {
    std::cout << "  Testing calibration job publish..." << std::endl;

    Config config;
    FakeRepository repository;
    repository.outcomes = dominance_dataset();
    CalibrationStore store(default_calibration(config));
    CalibrationJob job(config, repository, store);

    auto result = job.run(kNow);
    assert(result.status == CalibrationStatus::Published);
    assert(result.record);
    assert(repository.saved.size() == 1);
    assert(repository.saved[0].threshold == 75.0);
    assert(store.snapshot()->threshold == 75.0);
    assert(store.snapshot()->version == util::to_epoch_ms(kNow));
    assert(!repository.lock_held);
    assert(repository.release_count == 1);

    // A rerun at the same instant cannot supersede its own version
    auto again = job.run(kNow);
    assert(again.status == CalibrationStatus::Failed);
    assert(store.snapshot()->version == util::to_epoch_ms(kNow));
    assert(repository.saved.size() == 1);

    std::cout << "  Job publish: PASSED" << std::endl;
}

void test_job_keeps_previous_record() {
    std::cout << "  Testing job failure paths..." << std::endl;

    Config config;
    CalibrationStore store(calibration_record(5, 70.0));

    FakeRepository sparse;
    add(sparse.outcomes, 20, 80.0, true, 10.0);
    CalibrationJob sparse_job(config, sparse, store);
    auto insufficient = sparse_job.run(kNow);
    assert(insufficient.status == CalibrationStatus::InsufficientData);
    assert(!insufficient.record);
    assert(sparse.saved.empty());
    assert(store.snapshot()->version == 5);

    FakeRepository stalled;
    stalled.outcomes = dominance_dataset();
    stalled.fail_with_timeout = true;
    CalibrationJob stalled_job(config, stalled, store);
    auto timed_out = stalled_job.run(kNow);
    assert(timed_out.status == CalibrationStatus::TimedOut);
    assert(store.snapshot()->version == 5);
    assert(store.snapshot()->threshold == 70.0);
    assert(!stalled.lock_held);

    FakeRepository locked;
    locked.outcomes = dominance_dataset();
    locked.lock_available = false;
    CalibrationJob locked_job(config, locked, store);
    auto skipped = locked_job.run(kNow);
    assert(skipped.status == CalibrationStatus::AlreadyRunning);
    assert(locked.fetch_count == 0);
    assert(locked.release_count == 0);

    std::cout << "  Job failure paths: PASSED" << std::endl;
}

void test_job_never_supersedes_newer_record() {
    std::cout << "  Testing job against a newer active record..." << std::endl;

    Config config;
    const std::int64_t ahead = util::to_epoch_ms(kNow + std::chrono::seconds(5));

    // Another process with a clock slightly ahead already published in memory
    FakeRepository repository;
    repository.outcomes = dominance_dataset();
    CalibrationStore store(calibration_record(ahead, 70.0));
    CalibrationJob job(config, repository, store);

    auto result = job.run(kNow);
    assert(result.status == CalibrationStatus::Failed);
    assert(repository.saved.empty());
    assert(store.snapshot()->threshold == 70.0);
    assert(store.snapshot()->version == ahead);
    assert(!repository.lock_held);

    // The newer record is only in the repository: the save is refused and nothing is published
    FakeRepository stored;
    stored.outcomes = dominance_dataset();
    stored.saved.push_back(calibration_record(ahead, 90.0));
    CalibrationStore fresh(default_calibration(config));
    CalibrationJob fresh_job(config, stored, fresh);

    auto refused = fresh_job.run(kNow);
    assert(refused.status == CalibrationStatus::Failed);
    assert(stored.saved.size() == 1);
    assert(stored.load_active_record()->threshold == 90.0);
    assert(fresh.snapshot()->version == 0);
    assert(fresh.snapshot()->threshold == config.calibration.default_threshold);

    std::cout << "  Newer active record: PASSED" << std::endl;
}

void test_job_never_overlaps() {
    std::cout << "  Testing job non-overlap..." << std::endl;

    Config config;
    FakeRepository repository;
    repository.outcomes = dominance_dataset();

    std::promise<void> release;
    repository.gate = release.get_future().share();
    auto started = repository.fetch_started.get_future();

    CalibrationStore store(default_calibration(config));
    CalibrationJob job(config, repository, store);

    auto first = std::async(std::launch::async, [&]() { return job.run(kNow); });
    started.wait();

    // First run is parked inside the fetch
    auto second = job.run(kNow + std::chrono::minutes(1));
    assert(second.status == CalibrationStatus::AlreadyRunning);
    assert(repository.fetch_count == 1);

    release.set_value();
    auto first_result = first.get();
    assert(first_result.status == CalibrationStatus::Published);
    assert(store.snapshot()->threshold == 75.0);

    std::cout << "  Job non-overlap: PASSED" << std::endl;
}

int main() {
    std::cout << "Running calibration tests..." << std::endl;

    test_grid_and_scoring();
    test_dominant_threshold();
    test_tie_break();
    test_insufficient_data();
    test_job_publishes();
    test_job_keeps_previous_record();
    test_job_never_supersedes_newer_record();
    test_job_never_overlaps();

    std::cout << "All tests PASSED!" << std::endl;
    return 0;
}
