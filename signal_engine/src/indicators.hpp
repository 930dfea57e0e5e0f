#pragma once

#include "config.hpp"
#include "types.hpp"
#include <vector>

namespace indicators {

// Column view of a candle sequence
struct PriceSeries {
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    std::vector<double> volumes;

    static PriceSeries from_candles(const CandleSeries& candles);
    std::size_t size() const { return closes.size(); }
};

struct ChoppinessReading {
    double value = 50.0;
    bool degenerate = false;
};

// All functions throw InsufficientDataError when the input is shorter than
// the lookback, except adx() and choppiness() which return neutral values.
double sma(const std::vector<double>& values, int period);
double ema(const std::vector<double>& values, int period);
double rsi(const std::vector<double>& closes, int period);
double atr(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, int period);
double adx(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, int period);
ChoppinessReading choppiness(const std::vector<double>& highs, const std::vector<double>& lows,
                             const std::vector<double>& closes, int period);
double vwap(const CandleSeries& candles);

// Close relative to its EMA
TrendBias trend_of(const std::vector<double>& closes, int period);

} // namespace indicators

class IndicatorEngine {
public:
    explicit IndicatorEngine(const Config& config);

    // M5 drives the entry indicators, M15 the volatility and mid EMA, H1 the
    // higher-timeframe bias. price is the evaluation price (quote mid or last close).
    IndicatorSet compute(const CandleSeries& m5, const CandleSeries& m15, const CandleSeries& h1,
                         TimePoint as_of, double price) const;

    std::size_t required_m5() const;
    std::size_t required_m15() const;
    std::size_t required_h1() const;

private:
    const Config& config_;
};
