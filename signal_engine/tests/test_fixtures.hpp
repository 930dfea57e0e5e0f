#pragma once

#include <cmath>
#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/calibration.hpp"
#include "../src/config.hpp"
#include "../src/errors.hpp"
#include "../src/types.hpp"
#include "../src/util.hpp"

namespace fixtures {

inline bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

inline TimePoint at(const std::string& iso) {
    return util::parse_iso8601(iso);
}

inline Candle candle(TimePoint t, double open, double high, double low, double close, double volume = 0.0) {
    Candle c;
    c.timestamp = t;
    c.open = open;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = volume;
    return c;
}

// Closes rise by step each bar; highs and lows rise with them
inline CandleSeries rising_series(TimePoint start, std::chrono::minutes spacing, int count,
                                  double first_close, double step) {
    CandleSeries series;
    for (int i = 0; i < count; ++i) {
        double close = first_close + step * i;
        double open = close - step;
        series.push_back(candle(start + spacing * i, open, close + step * 0.25, open - step * 0.25, close, 100.0));
    }
    return series;
}

// Closes fall by step each bar
inline CandleSeries falling_series(TimePoint start, std::chrono::minutes spacing, int count,
                                   double first_close, double step) {
    CandleSeries series;
    for (int i = 0; i < count; ++i) {
        double close = first_close - step * i;
        double open = close + step;
        series.push_back(candle(start + spacing * i, open, open + step * 0.25, close - step * 0.25, close, 100.0));
    }
    return series;
}

// Closes alternate around a center with a fixed bar range
inline CandleSeries sideways_series(TimePoint start, std::chrono::minutes spacing, int count,
                                    double center, double swing) {
    CandleSeries series;
    for (int i = 0; i < count; ++i) {
        double close = i % 2 == 0 ? center + swing : center - swing;
        double open = i % 2 == 0 ? center - swing : center + swing;
        series.push_back(candle(start + spacing * i, open, center + swing * 1.5, center - swing * 1.5, close, 100.0));
    }
    return series;
}

inline IndicatorSet neutral_indicators() {
    IndicatorSet ind;
    ind.price = 1.1000;
    ind.ema_fast = 1.1000;
    ind.ema_slow = 1.1000;
    ind.ema_mid = 1.1000;
    ind.rsi = 50.0;
    ind.atr = 0.0010;
    ind.atr_percent = 0.0909;
    ind.adx = 20.0;
    ind.choppiness = 55.0;
    ind.vwap = 1.1000;
    ind.m15_trend = TrendBias::Bearish;
    ind.h1_trend = TrendBias::Bearish;
    return ind;
}

inline CalibrationRecord calibration_record(std::int64_t version, double threshold) {
    CalibrationRecord record;
    record.version = version;
    record.threshold = threshold;
    record.computed_at = util::from_epoch_ms(version);
    return record;
}

inline LabeledOutcome outcome(Direction direction, double confidence, bool win, double pips, TimePoint created_at) {
    LabeledOutcome o;
    o.direction = direction;
    o.confidence = confidence;
    o.win = win;
    o.win_pips = win ? pips : 0.0;
    o.loss_pips = win ? 0.0 : pips;
    o.created_at = created_at;
    return o;
}

// In-memory repository with switches for the failure paths
class FakeRepository : public CalibrationRepository {
public:
    std::vector<LabeledOutcome> outcomes;
    std::vector<CalibrationRecord> saved;
    bool lock_available = true;
    bool lock_held = false;
    bool fail_with_timeout = false;
    int fetch_count = 0;
    int release_count = 0;

    // When set, fetch blocks until the future is ready
    std::optional<std::shared_future<void>> gate;
    std::promise<void> fetch_started;

    std::vector<LabeledOutcome> fetch_labeled_outcomes(TimePoint since, std::chrono::seconds timeout) override {
        ++fetch_count;
        if (gate) {
            fetch_started.set_value();
            gate->wait();
        }
        if (fail_with_timeout) {
            throw CalibrationTimeoutError("labeled signal fetch exceeded " + std::to_string(timeout.count()) + "s");
        }
        std::vector<LabeledOutcome> result;
        for (const auto& o : outcomes) {
            if (o.created_at >= since) {
                result.push_back(o);
            }
        }
        return result;
    }

    bool save_calibration_record(const CalibrationRecord& record) override {
        for (const auto& existing : saved) {
            if (existing.version >= record.version) {
                return false;
            }
        }
        saved.push_back(record);
        return true;
    }

    std::optional<CalibrationRecord> load_active_record() override {
        if (saved.empty()) {
            return std::nullopt;
        }
        return saved.back();
    }

    bool try_acquire_run_lock() override {
        if (!lock_available || lock_held) {
            return false;
        }
        lock_held = true;
        return true;
    }

    void release_run_lock() override {
        lock_held = false;
        ++release_count;
    }
};

} // namespace fixtures
