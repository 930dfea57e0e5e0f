#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>

struct RoundNumbers {
    double above = 0.0;
    double below = 0.0;
};

struct PreviousPeriod {
    std::optional<double> high;
    std::optional<double> low;
};

// Session and structural levels for the evaluation day
class LevelCalculator {
public:
    explicit LevelCalculator(const Config& config);

    // High/low of the first ib_duration minutes after open_hour on the UTC date of as_of.
    // Empty when no candle falls inside the window.
    std::optional<InitialBalance> initial_balance(const CandleSeries& candles, TimePoint as_of,
                                                  int open_hour, const std::string& name) const;

    // IB of the session currently trading, London or New York
    std::optional<InitialBalance> active_initial_balance(const CandleSeries& candles, TimePoint as_of) const;

    // Extremes over the UTC day before as_of
    PreviousPeriod previous_period(const CandleSeries& candles, TimePoint as_of) const;

    static RoundNumbers round_numbers(double price, double step);

    Session session_at(TimePoint t) const;

    // Name of the session whose post-IB breakout window contains t
    std::optional<std::string> open_breakout_window(TimePoint t) const;

    SessionLevels compute(const CandleSeries& intraday, const CandleSeries& history,
                          SymbolClass symbol_class, TimePoint as_of, double price) const;

private:
    const Config& config_;
};
