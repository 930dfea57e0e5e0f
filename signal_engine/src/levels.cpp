#include "levels.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    constexpr double kGridTolerance = 1e-9;
    constexpr const char* kLondon = "LONDON";
    constexpr const char* kNewYork = "NY";
}

LevelCalculator::LevelCalculator(const Config& config) : config_(config) {}

std::optional<InitialBalance> LevelCalculator::initial_balance(const CandleSeries& candles, TimePoint as_of,
                                                               int open_hour, const std::string& name) const {
    const auto day = util::utc_day_index(as_of);
    const int window_start = open_hour * 60;
    const int window_end = window_start + config_.sessions.ib_duration_minutes;

    std::optional<InitialBalance> ib;
    for (const auto& c : candles) {
        if (c.timestamp > as_of || util::utc_day_index(c.timestamp) != day) {
            continue;
        }
        int minute = util::minutes_of_day(c.timestamp);
        if (minute < window_start || minute >= window_end) {
            continue;
        }
        if (!ib) {
            ib = InitialBalance{name, c.high, c.low};
        } else {
            ib->high = std::max(ib->high, c.high);
            ib->low = std::min(ib->low, c.low);
        }
    }
    return ib;
}

std::optional<InitialBalance> LevelCalculator::active_initial_balance(const CandleSeries& candles,
                                                                      TimePoint as_of) const {
    switch (session_at(as_of)) {
        case Session::London:
            return initial_balance(candles, as_of, config_.sessions.london_open_hour, kLondon);
        case Session::NewYork:
            return initial_balance(candles, as_of, config_.sessions.ny_open_hour, kNewYork);
        case Session::Asian:
        case Session::Closed:
            break;
    }
    return std::nullopt;
}

PreviousPeriod LevelCalculator::previous_period(const CandleSeries& candles, TimePoint as_of) const {
    const auto yesterday = util::utc_day_index(as_of) - 1;

    PreviousPeriod result;
    for (const auto& c : candles) {
        if (util::utc_day_index(c.timestamp) != yesterday) {
            continue;
        }
        result.high = result.high ? std::max(*result.high, c.high) : c.high;
        result.low = result.low ? std::min(*result.low, c.low) : c.low;
    }
    return result;
}

RoundNumbers LevelCalculator::round_numbers(double price, double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("round number step must be positive");
    }
    double q = price / step;
    double nearest = std::round(q);
    if (std::abs(q - nearest) < kGridTolerance) {
        return {nearest * step, nearest * step};
    }
    return {std::ceil(q) * step, std::floor(q) * step};
}

Session LevelCalculator::session_at(TimePoint t) const {
    const auto& s = config_.sessions;
    int hour = util::minutes_of_day(t) / 60;
    if (hour >= s.asian_start_hour && hour < s.london_start_hour) {
        return Session::Asian;
    }
    if (hour >= s.london_start_hour && hour < s.ny_start_hour) {
        return Session::London;
    }
    if (hour >= s.ny_start_hour && hour < s.ny_end_hour) {
        return Session::NewYork;
    }
    return Session::Closed;
}

std::optional<std::string> LevelCalculator::open_breakout_window(TimePoint t) const {
    const auto& s = config_.sessions;
    int minute = util::minutes_of_day(t);

    auto inside = [&](int open_hour) {
        int ib_end = open_hour * 60 + s.ib_duration_minutes;
        return minute >= ib_end && minute < ib_end + s.breakout_window_minutes;
    };

    if (inside(s.london_open_hour)) {
        return std::string(kLondon);
    }
    if (inside(s.ny_open_hour)) {
        return std::string(kNewYork);
    }
    return std::nullopt;
}

SessionLevels LevelCalculator::compute(const CandleSeries& intraday, const CandleSeries& history,
                                       SymbolClass symbol_class, TimePoint as_of, double price) const {
    SessionLevels levels;
    levels.session = session_at(as_of);
    levels.initial_balance = active_initial_balance(intraday, as_of);
    levels.open_breakout_window = open_breakout_window(as_of);

    auto previous = previous_period(history, as_of);
    levels.previous_period_high = previous.high;
    levels.previous_period_low = previous.low;

    auto round = round_numbers(price, config_.class_params(symbol_class).round_number_step);
    levels.round_number_above = round.above;
    levels.round_number_below = round.below;

    spdlog::debug("Levels: session={} ib={} pdh={} pdl={} round=[{}, {}]",
                  to_string(levels.session),
                  levels.initial_balance ? fmt::format("{:.5f}-{:.5f}", levels.initial_balance->low,
                                                       levels.initial_balance->high)
                                         : "none",
                  levels.previous_period_high ? fmt::format("{:.5f}", *levels.previous_period_high) : "none",
                  levels.previous_period_low ? fmt::format("{:.5f}", *levels.previous_period_low) : "none",
                  levels.round_number_below, levels.round_number_above);
    return levels;
}
