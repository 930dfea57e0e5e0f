#include "indicators.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace indicators {

namespace {
    void check_period(int period) {
        if (period < 1) {
            throw std::invalid_argument(fmt::format("indicator period must be positive, got {}", period));
        }
    }

    void require(const std::string& name, std::size_t required, std::size_t actual) {
        if (actual < required) {
            throw InsufficientDataError(name, required, actual);
        }
    }

    void check_columns(const std::vector<double>& highs, const std::vector<double>& lows,
                       const std::vector<double>& closes) {
        if (highs.size() != lows.size() || highs.size() != closes.size()) {
            throw std::invalid_argument("high/low/close columns differ in length");
        }
    }

    double true_range(double high, double low, double prev_close) {
        return std::max({high - low, std::abs(high - prev_close), std::abs(low - prev_close)});
    }
}

PriceSeries PriceSeries::from_candles(const CandleSeries& candles) {
    PriceSeries s;
    s.highs.reserve(candles.size());
    s.lows.reserve(candles.size());
    s.closes.reserve(candles.size());
    s.volumes.reserve(candles.size());
    for (const auto& c : candles) {
        s.highs.push_back(c.high);
        s.lows.push_back(c.low);
        s.closes.push_back(c.close);
        s.volumes.push_back(c.volume);
    }
    return s;
}

double sma(const std::vector<double>& values, int period) {
    check_period(period);
    require(fmt::format("sma({})", period), period, values.size());
    double sum = std::accumulate(values.end() - period, values.end(), 0.0);
    return sum / period;
}

double ema(const std::vector<double>& values, int period) {
    check_period(period);
    require(fmt::format("ema({})", period), period, values.size());

    const double k = 2.0 / (period + 1);
    double value = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        value = values[i] * k + value * (1.0 - k);
    }
    return value;
}

double rsi(const std::vector<double>& closes, int period) {
    check_period(period);
    require(fmt::format("rsi({})", period), static_cast<std::size_t>(period) + 1, closes.size());

    double gains = 0.0;
    double losses = 0.0;
    for (std::size_t i = closes.size() - period; i < closes.size(); ++i) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) {
            gains += delta;
        } else {
            losses -= delta;
        }
    }

    double avg_gain = gains / period;
    double avg_loss = losses / period;
    if (avg_loss == 0.0) {
        return 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double atr(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, int period) {
    check_period(period);
    check_columns(highs, lows, closes);
    require(fmt::format("atr({})", period), static_cast<std::size_t>(period) + 1, closes.size());

    double sum = 0.0;
    for (std::size_t i = closes.size() - period; i < closes.size(); ++i) {
        sum += true_range(highs[i], lows[i], closes[i - 1]);
    }
    return sum / period;
}

double adx(const std::vector<double>& highs, const std::vector<double>& lows,
           const std::vector<double>& closes, int period) {
    check_period(period);
    check_columns(highs, lows, closes);
    if (closes.size() < static_cast<std::size_t>(period) + 1) {
        return 0.0;
    }

    std::vector<double> dm_plus;
    std::vector<double> dm_minus;
    std::vector<double> tr;
    for (std::size_t i = 1; i < closes.size(); ++i) {
        double up = highs[i] - highs[i - 1];
        double down = lows[i - 1] - lows[i];
        dm_plus.push_back(up > down && up > 0 ? up : 0.0);
        dm_minus.push_back(down > up && down > 0 ? down : 0.0);
        tr.push_back(true_range(highs[i], lows[i], closes[i - 1]));
    }

    // Wilder smoothing: seed with the first window sum, then decay
    double s_plus = std::accumulate(dm_plus.begin(), dm_plus.begin() + period, 0.0);
    double s_minus = std::accumulate(dm_minus.begin(), dm_minus.begin() + period, 0.0);
    double s_tr = std::accumulate(tr.begin(), tr.begin() + period, 0.0);
    for (std::size_t i = period; i < tr.size(); ++i) {
        s_plus = s_plus - s_plus / period + dm_plus[i];
        s_minus = s_minus - s_minus / period + dm_minus[i];
        s_tr = s_tr - s_tr / period + tr[i];
    }

    if (s_tr <= 0.0) {
        return 0.0;
    }
    double di_plus = 100.0 * s_plus / s_tr;
    double di_minus = 100.0 * s_minus / s_tr;
    double di_sum = di_plus + di_minus;
    if (di_sum <= 0.0) {
        return 0.0;
    }
    return 100.0 * std::abs(di_plus - di_minus) / di_sum;
}

ChoppinessReading choppiness(const std::vector<double>& highs, const std::vector<double>& lows,
                             const std::vector<double>& closes, int period) {
    check_period(period);
    check_columns(highs, lows, closes);
    if (period < 2 || closes.size() < static_cast<std::size_t>(period)) {
        return {50.0, false};
    }

    const std::size_t start = closes.size() - period;
    double highest = *std::max_element(highs.begin() + start, highs.end());
    double lowest = *std::min_element(lows.begin() + start, lows.end());
    double range = highest - lowest;
    if (range <= 0.0) {
        return {100.0, true};
    }

    double tr_sum = 0.0;
    for (std::size_t i = start; i < closes.size(); ++i) {
        if (i == 0) {
            tr_sum += highs[i] - lows[i];
        } else {
            tr_sum += true_range(highs[i], lows[i], closes[i - 1]);
        }
    }

    return {100.0 * std::log10(tr_sum / range) / std::log10(static_cast<double>(period)), false};
}

double vwap(const CandleSeries& candles) {
    require("vwap", 1, candles.size());

    double pv = 0.0;
    double total_volume = 0.0;
    for (const auto& c : candles) {
        double typical = (c.high + c.low + c.close) / 3.0;
        double volume = c.volume > 0.0 ? c.volume : 1.0;
        pv += typical * volume;
        total_volume += volume;
    }
    return pv / total_volume;
}

TrendBias trend_of(const std::vector<double>& closes, int period) {
    double average = ema(closes, period);
    return closes.back() > average ? TrendBias::Bullish : TrendBias::Bearish;
}

} // namespace indicators

IndicatorEngine::IndicatorEngine(const Config& config) : config_(config) {}

std::size_t IndicatorEngine::required_m5() const {
    const auto& p = config_.indicators;
    return static_cast<std::size_t>(std::max({p.ema_fast, p.ema_slow, p.rsi + 1, p.adx + 1, p.choppiness}));
}

std::size_t IndicatorEngine::required_m15() const {
    const auto& p = config_.indicators;
    return static_cast<std::size_t>(std::max({p.ema_mid, p.trend_ema, p.atr + 1}));
}

std::size_t IndicatorEngine::required_h1() const {
    return static_cast<std::size_t>(config_.indicators.trend_ema);
}

IndicatorSet IndicatorEngine::compute(const CandleSeries& m5, const CandleSeries& m15,
                                      const CandleSeries& h1, TimePoint as_of, double price) const {
    if (m5.size() < required_m5()) {
        throw InsufficientDataError(kTimeframeM5, required_m5(), m5.size());
    }
    if (m15.size() < required_m15()) {
        throw InsufficientDataError(kTimeframeM15, required_m15(), m15.size());
    }
    if (h1.size() < required_h1()) {
        throw InsufficientDataError(kTimeframeH1, required_h1(), h1.size());
    }

    const auto& p = config_.indicators;
    auto s5 = indicators::PriceSeries::from_candles(m5);
    auto s15 = indicators::PriceSeries::from_candles(m15);
    auto s60 = indicators::PriceSeries::from_candles(h1);

    IndicatorSet set;
    set.price = price;
    set.ema_fast = indicators::ema(s5.closes, p.ema_fast);
    set.ema_slow = indicators::ema(s5.closes, p.ema_slow);
    set.rsi = indicators::rsi(s5.closes, p.rsi);
    set.adx = indicators::adx(s5.highs, s5.lows, s5.closes, p.adx);

    auto chop = indicators::choppiness(s5.highs, s5.lows, s5.closes, p.choppiness);
    set.choppiness = chop.value;
    set.choppiness_degenerate = chop.degenerate;
    if (chop.degenerate) {
        spdlog::warn("Flat M5 range over {} bars, choppiness substituted with {}", p.choppiness, chop.value);
    }

    set.ema_mid = indicators::ema(s15.closes, p.ema_mid);
    set.atr = indicators::atr(s15.highs, s15.lows, s15.closes, p.atr);
    set.atr_percent = price > 0.0 ? set.atr / price * 100.0 : 0.0;
    set.m15_trend = indicators::trend_of(s15.closes, p.trend_ema);
    set.h1_trend = indicators::trend_of(s60.closes, p.trend_ema);

    // Session VWAP: today's M5 bars up to the evaluation time, else a trailing window
    const auto today = util::utc_day_index(as_of);
    CandleSeries session;
    for (const auto& c : m5) {
        if (c.timestamp <= as_of && util::utc_day_index(c.timestamp) == today) {
            session.push_back(c);
        }
    }
    if (session.empty()) {
        std::size_t n = std::min(m5.size(), static_cast<std::size_t>(p.vwap_fallback_bars));
        session.assign(m5.end() - n, m5.end());
    }
    set.vwap = indicators::vwap(session);

    spdlog::debug("Indicators: ema{}={:.5f} ema{}={:.5f} rsi={:.1f} adx={:.1f} chop={:.1f} atr={:.5f} vwap={:.5f}",
                  p.ema_fast, set.ema_fast, p.ema_slow, set.ema_slow, set.rsi, set.adx,
                  set.choppiness, set.atr, set.vwap);
    return set;
}
