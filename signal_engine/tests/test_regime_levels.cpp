/**
 * Regime classifier and level calculator tests
 */

#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>

#include "../src/levels.hpp"
#include "../src/regime.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;

// ============================================================================
// Regime
// ============================================================================

void test_regime_classification() {
    std::cout << "  Testing regime classification..." << std::endl;

    Config config;
    RegimeClassifier classifier(config);

    assert(classifier.classify(30.0, 40.0).regime == Regime::Trend);
    // Strong ADX but choppy price action is not a trend
    assert(classifier.classify(30.0, 50.0).regime == Regime::Uncertain);
    assert(classifier.classify(30.0, 65.0).regime == Regime::Range);
    assert(classifier.classify(20.0, 70.0).regime == Regime::Range);
    assert(classifier.classify(20.0, 55.0).regime == Regime::Uncertain);
    assert(classifier.classify(25.0, 40.0).regime == Regime::Uncertain);
    // Flat-range substitution lands in RANGE
    assert(classifier.classify(0.0, 100.0).regime == Regime::Range);

    auto result = classifier.classify(31.5, 42.0);
    assert(result.adx == 31.5);
    assert(result.choppiness == 42.0);

    std::cout << "  Regime classification: PASSED" << std::endl;
}

void test_regime_determinism() {
    std::cout << "  Testing regime determinism..." << std::endl;

    Config config;
    RegimeClassifier classifier(config);

    IndicatorSet ind = neutral_indicators();
    for (double adx = 0.0; adx <= 60.0; adx += 2.5) {
        for (double chop = 20.0; chop <= 100.0; chop += 5.0) {
            ind.adx = adx;
            ind.choppiness = chop;
            auto first = classifier.classify(ind);
            auto second = classifier.classify(adx, chop);
            assert(first.regime == second.regime);
        }
    }

    std::cout << "  Regime determinism: PASSED" << std::endl;
}

// ============================================================================
// Sessions
// ============================================================================

void test_sessions() {
    std::cout << "  Testing session clock..." << std::endl;

    Config config;
    LevelCalculator levels(config);

    assert(levels.session_at(at("2025-01-15T03:00:00Z")) == Session::Asian);
    assert(levels.session_at(at("2025-01-15T07:00:00Z")) == Session::London);
    assert(levels.session_at(at("2025-01-15T09:00:00Z")) == Session::London);
    assert(levels.session_at(at("2025-01-15T12:00:00Z")) == Session::NewYork);
    assert(levels.session_at(at("2025-01-15T19:59:00Z")) == Session::NewYork);
    assert(levels.session_at(at("2025-01-15T20:00:00Z")) == Session::Closed);

    assert(levels.open_breakout_window(at("2025-01-15T09:05:00Z")) == std::optional<std::string>("LONDON"));
    assert(!levels.open_breakout_window(at("2025-01-15T09:15:00Z")));
    assert(!levels.open_breakout_window(at("2025-01-15T08:30:00Z")));
    assert(levels.open_breakout_window(at("2025-01-15T14:10:00Z")) == std::optional<std::string>("NY"));

    std::cout << "  Session clock: PASSED" << std::endl;
}

// ============================================================================
// Levels
// ============================================================================

CandleSeries london_morning() {
    CandleSeries bars;
    auto start = at("2025-01-15T07:00:00Z");
    for (int i = 0; i < 36; ++i) {
        auto t = start + std::chrono::minutes(5 * i);
        bars.push_back(candle(t, 1.1010, 1.1030, 1.1000, 1.1020, 50.0));
    }
    // Outside the 08:00-09:00 window
    bars[6].high = 1.1200;
    bars[30].low = 1.0800;
    // Inside the window
    bars[16].high = 1.1050;  // 08:20
    bars[20].low = 1.0990;   // 08:40
    return bars;
}

void test_initial_balance() {
    std::cout << "  Testing initial balance extraction..." << std::endl;

    Config config;
    LevelCalculator levels(config);
    auto bars = london_morning();

    auto ib = levels.initial_balance(bars, at("2025-01-15T09:30:00Z"), 8, "LONDON");
    assert(ib);
    assert(ib->session == "LONDON");
    assert(ib->high == 1.1050);
    assert(ib->low == 1.0990);

    // Bars after as_of are ignored
    auto partial = levels.initial_balance(bars, at("2025-01-15T08:15:00Z"), 8, "LONDON");
    assert(partial);
    assert(partial->high == 1.1030);
    assert(partial->low == 1.1000);

    // Nothing traded in the window yet
    assert(!levels.initial_balance(bars, at("2025-01-15T07:30:00Z"), 8, "LONDON"));

    auto active = levels.active_initial_balance(bars, at("2025-01-15T09:30:00Z"));
    assert(active && active->session == "LONDON");
    assert(!levels.active_initial_balance(bars, at("2025-01-15T03:00:00Z")));

    std::cout << "  Initial balance: PASSED" << std::endl;
}

void test_previous_period() {
    std::cout << "  Testing previous period extremes..." << std::endl;

    Config config;
    LevelCalculator levels(config);

    CandleSeries h1;
    auto day_before = at("2025-01-13T00:00:00Z");
    for (int i = 0; i < 72; ++i) {
        h1.push_back(candle(day_before + std::chrono::hours(i), 1.1000, 1.1020, 1.0980, 1.1000));
    }
    h1[5].high = 1.1500;    // 2025-01-13
    h1[30].high = 1.1100;   // 2025-01-14
    h1[40].low = 1.0900;    // 2025-01-14
    h1[50].low = 1.0500;    // 2025-01-15

    auto previous = levels.previous_period(h1, at("2025-01-15T10:00:00Z"));
    assert(previous.high && *previous.high == 1.1100);
    assert(previous.low && *previous.low == 1.0900);

    auto none = levels.previous_period(h1, at("2025-01-20T10:00:00Z"));
    assert(!none.high && !none.low);

    std::cout << "  Previous period: PASSED" << std::endl;
}

void test_round_numbers() {
    std::cout << "  Testing round numbers..." << std::endl;

    auto between = LevelCalculator::round_numbers(1.1022, 0.005);
    assert(near(between.above, 1.105));
    assert(near(between.below, 1.100));

    auto on_grid = LevelCalculator::round_numbers(1.1, 0.005);
    assert(near(on_grid.above, 1.1));
    assert(near(on_grid.below, 1.1));

    auto jpy = LevelCalculator::round_numbers(148.23, 0.5);
    assert(near(jpy.above, 148.5));
    assert(near(jpy.below, 148.0));

    bool thrown = false;
    try {
        LevelCalculator::round_numbers(1.1, 0.0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  Round numbers: PASSED" << std::endl;
}

void test_compute_levels() {
    std::cout << "  Testing combined level snapshot..." << std::endl;

    Config config;
    LevelCalculator levels(config);
    auto bars = london_morning();

    CandleSeries h1;
    auto yesterday = at("2025-01-14T00:00:00Z");
    for (int i = 0; i < 24; ++i) {
        h1.push_back(candle(yesterday + std::chrono::hours(i), 1.1000, 1.1080, 1.0950, 1.1000));
    }

    auto snapshot = levels.compute(bars, h1, SymbolClass::MajorFx, at("2025-01-15T09:05:00Z"), 1.1022);
    assert(snapshot.session == Session::London);
    assert(snapshot.initial_balance && snapshot.initial_balance->high == 1.1050);
    assert(snapshot.open_breakout_window == std::optional<std::string>("LONDON"));
    assert(snapshot.previous_period_high && *snapshot.previous_period_high == 1.1080);
    assert(snapshot.previous_period_low && *snapshot.previous_period_low == 1.0950);
    assert(near(snapshot.round_number_above, 1.105));
    assert(near(snapshot.round_number_below, 1.100));

    std::cout << "  Combined levels: PASSED" << std::endl;
}

int main() {
    std::cout << "Running regime and level tests..." << std::endl;

    test_regime_classification();
    test_regime_determinism();
    test_sessions();
    test_initial_balance();
    test_previous_period();
    test_round_numbers();
    test_compute_levels();

    std::cout << "All tests PASSED!" << std::endl;
    return 0;
}
