/**
 * Request parsing and end-to-end pipeline tests
 */

#include <iostream>
#include <cassert>
#include <chrono>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "../src/signal_pipeline.hpp"
#include "test_fixtures.hpp"

using namespace fixtures;
using json = nlohmann::json;

namespace {
    json bars_json(const CandleSeries& series) {
        json bars = json::array();
        for (const auto& c : series) {
            bars.push_back(c.to_json());
        }
        return bars;
    }

    // M5 ends at 09:55 on 2025-01-15 so the London session is active
    json request_json(const std::string& shape, int m5_count = 60, int m15_count = 80, int h1_count = 60) {
        auto m5_start = at("2025-01-15T09:55:00Z") - std::chrono::minutes(5) * (m5_count - 1);
        auto m15_start = at("2025-01-15T09:45:00Z") - std::chrono::minutes(15) * (m15_count - 1);
        auto h1_start = at("2025-01-15T09:00:00Z") - std::chrono::minutes(60) * (h1_count - 1);

        CandleSeries m5, m15, h1;
        if (shape == "rising") {
            m5 = rising_series(m5_start, std::chrono::minutes(5), m5_count, 1.0950, 0.0002);
            m15 = rising_series(m15_start, std::chrono::minutes(15), m15_count, 1.0900, 0.0003);
            h1 = rising_series(h1_start, std::chrono::minutes(60), h1_count, 1.0800, 0.0005);
        } else if (shape == "falling") {
            m5 = falling_series(m5_start, std::chrono::minutes(5), m5_count, 1.1050, 0.0002);
            m15 = falling_series(m15_start, std::chrono::minutes(15), m15_count, 1.1100, 0.0003);
            h1 = falling_series(h1_start, std::chrono::minutes(60), h1_count, 1.1200, 0.0005);
        } else {
            m5 = sideways_series(m5_start, std::chrono::minutes(5), m5_count, 1.1000, 0.0004);
            m15 = sideways_series(m15_start, std::chrono::minutes(15), m15_count, 1.1000, 0.0006);
            h1 = sideways_series(h1_start, std::chrono::minutes(60), h1_count, 1.1000, 0.0010);
        }

        return json{
            {"corr_id", "req-" + shape},
            {"symbol", "eurusd"},
            {"candles", {
                {"m5", bars_json(m5)},
                {"M15", bars_json(m15)},
                {"H1", bars_json(h1)}
            }}
        };
    }

    SignalRequest parse(const json& j) {
        auto request = SignalRequest::from_json(j);
        assert(request);
        return *request;
    }

    bool correct_sides(const SignalRecord& record) {
        if (record.direction == Direction::Buy) {
            return record.stop_loss < record.entry_price && record.entry_price < record.take_profit;
        }
        return record.take_profit < record.entry_price && record.entry_price < record.stop_loss;
    }
}

// ============================================================================
// Request parsing
// ============================================================================

void test_request_parsing() {
    std::cout << "  Testing signal request parsing..." << std::endl;

    json j = request_json("rising");
    j["quote"] = {{"bid", 1.1067}, {"ask", 1.1069}};
    j["prediction"] = {{"direction", "buy"}, {"confidence", 81.0}};
    j["sentiment"] = {{"score", 4.2}, {"confidence", 0.8}};

    auto request = parse(j);
    assert(request.corr_id == "req-rising");
    assert(request.symbol == "EURUSD");
    assert(request.series(kTimeframeM5).size() == 60);
    assert(request.series(kTimeframeM15).size() == 80);
    assert(request.series(kTimeframeH1).size() == 60);
    assert(request.series("D1").empty());
    assert(request.quote && near(request.quote->ask, 1.1069));
    assert(request.prediction && request.prediction->direction == Direction::Buy);
    assert(request.prediction->model_available);
    assert(request.sentiment && near(request.sentiment->risk_confidence, 0.8));
    assert(!request.as_of);

    std::cout << "  Request parsing: PASSED" << std::endl;
}

void test_malformed_requests() {
    std::cout << "  Testing malformed requests..." << std::endl;

    json crossed = request_json("rising");
    crossed["quote"] = {{"bid", 1.1070}, {"ask", 1.1068}};
    assert(!SignalRequest::from_json(crossed));

    json unordered = request_json("rising");
    std::swap(unordered["candles"]["m5"][3], unordered["candles"]["m5"][4]);
    assert(!SignalRequest::from_json(unordered));

    json inverted = request_json("rising");
    inverted["candles"]["H1"][0]["h"] = 1.0;
    assert(!SignalRequest::from_json(inverted));

    json no_symbol = request_json("rising");
    no_symbol.erase("symbol");
    assert(!SignalRequest::from_json(no_symbol));

    json no_candles = request_json("rising");
    no_candles.erase("candles");
    assert(!SignalRequest::from_json(no_candles));

    std::cout << "  Malformed requests: PASSED" << std::endl;
}

// ============================================================================
// Evaluation
// ============================================================================

void test_evaluate_uptrend() {
    std::cout << "  Testing evaluation of a rising market..." << std::endl;

    Config config;
    CalibrationStore store(calibration_record(42, 65.0));
    SignalPipeline pipeline(config, store);

    json j = request_json("rising");
    j["quote"] = {{"bid", 1.1067}, {"ask", 1.1069}};
    auto request = parse(j);

    auto record = pipeline.evaluate(request);
    assert(record.corr_id == "req-rising");
    assert(record.symbol == "EURUSD");
    assert(record.direction != Direction::Hold);
    assert(correct_sides(record));
    assert(near(record.entry_price, 1.1068, 1e-12));
    assert(record.confidence >= 0.0 && record.confidence <= 100.0);
    assert(record.risk_reward_ratio > 0.0);
    assert(record.confidence_threshold == 65.0);
    assert(record.calibration_version == 42);
    assert(record.actionable == (record.confidence >= 65.0));
    assert(record.as_of == at("2025-01-15T09:55:00Z"));
    assert(!record.reasons.empty());

    // Same input, same output
    auto again = pipeline.evaluate(request);
    assert(record.to_json().dump() == again.to_json().dump());

    std::cout << "  Uptrend evaluation: PASSED" << std::endl;
}

void test_never_hold() {
    std::cout << "  Testing direction is always actionable..." << std::endl;

    Config config;
    CalibrationStore store(default_calibration(config));
    SignalPipeline pipeline(config, store);
    int checked = 0;

    for (const std::string shape : {"rising", "falling", "sideways"}) {
        for (int variant = 0; variant < 4; ++variant) {
            json j = request_json(shape);
            if (variant & 1) {
                j["quote"] = {{"bid", 1.0999}, {"ask", 1.1001}};
            }
            if (variant & 2) {
                j["prediction"] = {{"direction", "SELL"}, {"confidence", 90.0}};
            }
            auto record = pipeline.evaluate(parse(j));
            assert(record.direction == Direction::Buy || record.direction == Direction::Sell);
            assert(correct_sides(record));
            assert(record.stop_distance_pips > 0.0);
            ++checked;
        }
    }

    std::cout << "  Never HOLD: PASSED (" << checked << " cases)" << std::endl;
}

void test_calibration_snapshot() {
    std::cout << "  Testing calibration swap between requests..." << std::endl;

    Config config;
    CalibrationStore store(calibration_record(1, 60.0));
    SignalPipeline pipeline(config, store);
    auto request = parse(request_json("sideways"));

    auto before = pipeline.evaluate(request);
    assert(before.calibration_version == 1);

    assert(store.publish(calibration_record(2, 90.0)));
    auto after = pipeline.evaluate(request);
    assert(after.calibration_version == 2);
    assert(after.confidence_threshold == 90.0);
    assert(after.confidence == before.confidence);

    std::cout << "  Calibration snapshot: PASSED" << std::endl;
}

void test_insufficient_data() {
    std::cout << "  Testing insufficient candle history..." << std::endl;

    Config config;
    CalibrationStore store(default_calibration(config));
    SignalPipeline pipeline(config, store);

    json empty_m5 = request_json("rising");
    empty_m5["candles"]["m5"] = json::array();
    bool thrown = false;
    try {
        pipeline.evaluate(parse(empty_m5));
    } catch (const InsufficientDataError& e) {
        thrown = true;
        assert(e.series() == kTimeframeM5);
        assert(e.actual() == 0);
    }
    assert(thrown);

    thrown = false;
    try {
        pipeline.evaluate(parse(request_json("rising", 10)));
    } catch (const InsufficientDataError& e) {
        thrown = true;
        assert(e.series() == kTimeframeM5);
        assert(e.required() == 21);
        assert(e.actual() == 10);
    }
    assert(thrown);

    thrown = false;
    try {
        pipeline.evaluate(parse(request_json("falling", 60, 80, 5)));
    } catch (const InsufficientDataError& e) {
        thrown = true;
        assert(e.series() == kTimeframeH1);
    }
    assert(thrown);

    std::cout << "  Insufficient data: PASSED" << std::endl;
}

void test_bars_after_as_of_ignored() {
    std::cout << "  Testing bars after as_of are ignored..." << std::endl;

    Config config;
    CalibrationStore store(default_calibration(config));
    SignalPipeline pipeline(config, store);

    // Last 30 minutes of M5 and the last two M15 bars are later than as_of
    json j = request_json("rising");
    j["as_of"] = "2025-01-15T09:25:00Z";
    auto with_future = parse(j);

    SignalRequest trimmed = with_future;
    trimmed.as_of.reset();
    for (auto it = trimmed.candles.begin(); it != trimmed.candles.end(); ++it) {
        auto& series = it->second;
        while (!series.empty() && series.back().timestamp > at("2025-01-15T09:25:00Z")) {
            series.pop_back();
        }
    }
    assert(trimmed.series(kTimeframeM5).size() == 54);
    assert(trimmed.series(kTimeframeM15).size() == 78);

    auto a = pipeline.evaluate(with_future);
    auto b = pipeline.evaluate(trimmed);
    assert(a.as_of == at("2025-01-15T09:25:00Z"));
    assert(near(a.entry_price, 1.0950 + 0.0002 * 53, 1e-12));
    assert(a.to_json().dump() == b.to_json().dump());

    // as_of before every M5 bar leaves nothing to evaluate
    j["as_of"] = "2025-01-14T00:00:00Z";
    bool thrown = false;
    try {
        pipeline.evaluate(parse(j));
    } catch (const InsufficientDataError& e) {
        thrown = true;
        assert(e.series() == kTimeframeM5);
        assert(e.actual() == 0);
    }
    assert(thrown);

    std::cout << "  Bars after as_of: PASSED" << std::endl;
}

int main() {
    std::cout << "Running signal pipeline tests..." << std::endl;

    test_request_parsing();
    test_malformed_requests();
    test_evaluate_uptrend();
    test_never_hold();
    test_calibration_snapshot();
    test_insufficient_data();
    test_bars_after_as_of_ignored();

    std::cout << "All tests PASSED!" << std::endl;
    return 0;
}
