#include "strategy.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {
    TrendBias bias_for(Direction d) {
        return d == Direction::Buy ? TrendBias::Bullish : TrendBias::Bearish;
    }

    double distance_pct(double price, double level) {
        return price > 0.0 ? std::abs(price - level) / price * 100.0 : 0.0;
    }

    std::string bonus(const std::string& text, double amount) {
        return fmt::format("{} ({:+.0f})", text, amount);
    }
}

std::string to_string(StrategyState s) {
    switch (s) {
        case StrategyState::TrendBuyEval: return "TREND_BUY_EVAL";
        case StrategyState::TrendSellEval: return "TREND_SELL_EVAL";
        case StrategyState::RangeBuyEval: return "RANGE_BUY_EVAL";
        case StrategyState::RangeSellEval: return "RANGE_SELL_EVAL";
        case StrategyState::FallbackEval: return "FALLBACK_EVAL";
        case StrategyState::Emit: return "EMIT";
    }
    return "EMIT";
}

StrategySelector::StrategySelector(const Config& config) : config_(config) {}

CandidateSignal StrategySelector::select(const std::string& symbol, const IndicatorSet& ind,
                                         const SessionLevels& levels,
                                         const RegimeClassification& regime) const {
    return evaluate(symbol, ind, levels, regime).signal;
}

StrategySelection StrategySelector::evaluate(const std::string& symbol, const IndicatorSet& ind,
                                             const SessionLevels& levels,
                                             const RegimeClassification& regime) const {
    std::vector<std::string> reasons;
    std::vector<StrategyState> path;
    std::optional<CandidateSignal> emitted;

    StrategyState state = entry_state(ind, levels, regime, reasons);
    while (state != StrategyState::Emit) {
        path.push_back(state);
        switch (state) {
            case StrategyState::TrendBuyEval:
                emitted = eval_trend(Direction::Buy, ind, levels, reasons);
                state = emitted ? StrategyState::Emit : StrategyState::TrendSellEval;
                break;
            case StrategyState::TrendSellEval:
                emitted = eval_trend(Direction::Sell, ind, levels, reasons);
                state = emitted ? StrategyState::Emit : StrategyState::FallbackEval;
                break;
            case StrategyState::RangeBuyEval:
                emitted = eval_range(Direction::Buy, ind, levels, reasons);
                state = emitted ? StrategyState::Emit : StrategyState::RangeSellEval;
                break;
            case StrategyState::RangeSellEval:
                emitted = eval_range(Direction::Sell, ind, levels, reasons);
                state = emitted ? StrategyState::Emit : StrategyState::FallbackEval;
                break;
            case StrategyState::FallbackEval:
                emitted = eval_fallback(ind, regime, reasons);
                state = StrategyState::Emit;
                break;
            case StrategyState::Emit:
                break;
        }
    }

    StrategySelection selection;
    selection.signal = std::move(*emitted);
    selection.signal.symbol = symbol;
    selection.signal.reasons = std::move(reasons);
    selection.path = std::move(path);

    spdlog::debug("{}: {} base={:.0f} via {}", symbol, to_string(selection.signal.direction),
                  selection.signal.base_confidence, to_string(selection.path.back()));
    return selection;
}

StrategyState StrategySelector::entry_state(const IndicatorSet& ind, const SessionLevels& levels,
                                            const RegimeClassification& regime,
                                            std::vector<std::string>& reasons) const {
    if (ind.choppiness_degenerate) {
        reasons.push_back(fmt::format("Flat range: choppiness substituted with {:.0f}", ind.choppiness));
    }

    switch (regime.regime) {
        case Regime::Trend:
            reasons.push_back(fmt::format("TREND mode (ADX={:.1f}, Chop={:.1f})", regime.adx, regime.choppiness));
            return StrategyState::TrendBuyEval;
        case Regime::Range:
            reasons.push_back(fmt::format("RANGE mode (Chop={:.1f})", regime.choppiness));
            if (!levels.initial_balance) {
                reasons.push_back("No initial balance available for range trading");
                return StrategyState::FallbackEval;
            }
            return StrategyState::RangeBuyEval;
        case Regime::Uncertain:
            reasons.push_back(fmt::format("UNCERTAIN regime (ADX={:.1f}, Chop={:.1f})", regime.adx,
                                          regime.choppiness));
            break;
    }
    return StrategyState::FallbackEval;
}

std::optional<CandidateSignal> StrategySelector::eval_trend(Direction direction, const IndicatorSet& ind,
                                                            const SessionLevels& levels,
                                                            std::vector<std::string>& reasons) const {
    const auto& p = config_.strategy;
    const bool buy = direction == Direction::Buy;
    const TrendBias want = bias_for(direction);

    double rsi_min = buy ? p.trend_buy_rsi_min : p.trend_sell_rsi_min;
    double rsi_max = buy ? p.trend_buy_rsi_max : p.trend_sell_rsi_max;

    std::vector<std::string> failed;
    if (!(buy ? ind.ema_fast > ind.ema_slow : ind.ema_fast < ind.ema_slow)) {
        failed.push_back("EMA cross");
    }
    if (!(buy ? ind.price > ind.vwap : ind.price < ind.vwap)) {
        failed.push_back("VWAP side");
    }
    if (!(ind.rsi > rsi_min && ind.rsi < rsi_max)) {
        failed.push_back(fmt::format("RSI {:.1f} outside {:.0f}-{:.0f}", ind.rsi, rsi_min, rsi_max));
    }
    if (ind.h1_trend != want) {
        failed.push_back("H1 trend");
    }
    if (!(ind.atr_percent > p.trend_min_atr_pct)) {
        failed.push_back(fmt::format("ATR {:.3f}% below floor", ind.atr_percent));
    }
    if (!failed.empty()) {
        reasons.push_back(fmt::format("Trend {} rejected: {}", to_string(direction), fmt::join(failed, ", ")));
        return std::nullopt;
    }

    CandidateSignal signal;
    signal.direction = direction;
    signal.stop_mode = StopMode::Trend;
    double confidence = p.trend_base;
    reasons.push_back(fmt::format("Trend following {}: EMA cross + VWAP + momentum (RSI {:.1f})",
                                  to_string(direction), ind.rsi));

    if (ind.ema_mid > 0.0 && distance_pct(ind.ema_mid, ind.price) < p.pullback_tolerance_pct) {
        confidence += p.pullback_bonus;
        reasons.push_back(bonus(fmt::format("Pullback entry near EMA{}", config_.indicators.ema_mid),
                                p.pullback_bonus));
    }

    bool ib_break = false;
    if (levels.initial_balance) {
        const auto& ib = *levels.initial_balance;
        ib_break = buy ? ind.price > ib.high : ind.price < ib.low;
        if (ib_break) {
            confidence += p.ib_break_bonus;
            reasons.push_back(bonus(fmt::format("{} IB {}", ib.session, buy ? "breakout" : "breakdown"),
                                    p.ib_break_bonus));
        }
    }

    if (ib_break && levels.open_breakout_window && ind.m15_trend == want) {
        confidence += p.open_window_bonus;
        reasons.push_back(bonus(fmt::format("{} open {} with M15 confirmation", *levels.open_breakout_window,
                                            buy ? "breakout" : "breakdown"),
                                p.open_window_bonus));
    }

    if (ind.m15_trend == want && ind.h1_trend == want) {
        confidence += p.mtf_alignment_bonus;
        reasons.push_back(bonus("M15/H1 trend alignment", p.mtf_alignment_bonus));
    }

    if (buy && levels.previous_period_high &&
        ind.price > *levels.previous_period_high * (1.0 - p.previous_period_proximity)) {
        confidence -= p.previous_period_penalty;
        reasons.push_back(bonus("Near PDH resistance", -p.previous_period_penalty));
    }
    if (!buy && levels.previous_period_low &&
        ind.price < *levels.previous_period_low * (1.0 + p.previous_period_proximity)) {
        confidence -= p.previous_period_penalty;
        reasons.push_back(bonus("Near PDL support", -p.previous_period_penalty));
    }

    double round_level = buy ? levels.round_number_above : levels.round_number_below;
    if (distance_pct(ind.price, round_level) < p.round_number_proximity_pct) {
        confidence -= p.round_number_penalty;
        reasons.push_back(bonus(fmt::format("Near round number {:.5g}", round_level), -p.round_number_penalty));
    }

    signal.base_confidence = std::clamp(confidence, 0.0, 100.0);
    return signal;
}

std::optional<CandidateSignal> StrategySelector::eval_range(Direction direction, const IndicatorSet& ind,
                                                            const SessionLevels& levels,
                                                            std::vector<std::string>& reasons) const {
    const auto& p = config_.strategy;
    const bool buy = direction == Direction::Buy;
    if (!levels.initial_balance) {
        reasons.push_back("No initial balance available for range trading");
        return std::nullopt;
    }
    const auto& ib = *levels.initial_balance;

    std::vector<std::string> failed;
    bool at_extreme = buy ? ind.price <= ib.low * (1.0 + p.ib_touch_tolerance)
                          : ind.price >= ib.high * (1.0 - p.ib_touch_tolerance);
    if (!at_extreme) {
        failed.push_back(fmt::format("price away from IB {}", buy ? "low" : "high"));
    }
    if (!(buy ? ind.rsi < p.range_rsi_oversold : ind.rsi > p.range_rsi_overbought)) {
        failed.push_back(fmt::format("RSI {:.1f} not {}", ind.rsi, buy ? "oversold" : "overbought"));
    }
    if (!(ind.atr_percent > p.range_min_atr_pct)) {
        failed.push_back(fmt::format("ATR {:.3f}% below floor", ind.atr_percent));
    }
    if (!failed.empty()) {
        reasons.push_back(fmt::format("Range {} rejected: {}", to_string(direction), fmt::join(failed, ", ")));
        return std::nullopt;
    }

    CandidateSignal signal;
    signal.direction = direction;
    signal.stop_mode = StopMode::Range;
    signal.structural_stop_hint = buy ? ib.low : ib.high;
    signal.structural_target_hint = ind.vwap;
    signal.structural_level = buy ? levels.previous_period_high : levels.previous_period_low;

    double confidence = p.range_base;
    reasons.push_back(fmt::format("Mean reversion {}: price at {} IB {} ({:.5f})", to_string(direction),
                                  ib.session, buy ? "low" : "high", buy ? ib.low : ib.high));
    reasons.push_back(fmt::format("RSI {} ({:.1f})", buy ? "oversold" : "overbought", ind.rsi));

    if (buy && levels.previous_period_low &&
        ind.price <= *levels.previous_period_low * (1.0 + p.previous_period_confluence)) {
        confidence += p.range_previous_period_bonus;
        reasons.push_back(bonus("Confluence with PDL support", p.range_previous_period_bonus));
    }
    if (!buy && levels.previous_period_high &&
        ind.price >= *levels.previous_period_high * (1.0 - p.previous_period_confluence)) {
        confidence += p.range_previous_period_bonus;
        reasons.push_back(bonus("Confluence with PDH resistance", p.range_previous_period_bonus));
    }

    double round_level = buy ? levels.round_number_below : levels.round_number_above;
    if (distance_pct(ind.price, round_level) < p.round_number_proximity_pct) {
        confidence += p.range_round_number_bonus;
        reasons.push_back(bonus(fmt::format("Round number {} {:.5g}", buy ? "support" : "resistance", round_level),
                                p.range_round_number_bonus));
    }

    signal.base_confidence = std::clamp(confidence, 0.0, 100.0);
    return signal;
}

CandidateSignal StrategySelector::eval_fallback(const IndicatorSet& ind, const RegimeClassification& regime,
                                                std::vector<std::string>& reasons) const {
    const auto& p = config_.strategy;
    reasons.push_back("Fallback signal generation");

    CandidateSignal signal;
    signal.stop_mode = StopMode::Fallback;
    double confidence = 0.0;

    bool bullish = ind.ema_fast > ind.ema_slow && ind.price > ind.vwap && ind.rsi > p.fallback_buy_rsi_min;
    bool bearish = ind.ema_fast < ind.ema_slow && ind.price < ind.vwap && ind.rsi < p.fallback_sell_rsi_max;

    if (bullish) {
        signal.direction = Direction::Buy;
        confidence = p.fallback_momentum_base;
        reasons.push_back("Bullish momentum detected");
    } else if (bearish) {
        signal.direction = Direction::Sell;
        confidence = p.fallback_momentum_base;
        reasons.push_back("Bearish momentum detected");
    } else if (ind.m15_trend == TrendBias::Bullish && ind.h1_trend == TrendBias::Bullish) {
        signal.direction = Direction::Buy;
        confidence = p.fallback_alignment_base;
        reasons.push_back("Multi-timeframe bullish alignment");
    } else {
        signal.direction = Direction::Sell;
        confidence = p.fallback_alignment_base;
        reasons.push_back("Multi-timeframe bearish/neutral");
    }

    if (regime.regime == Regime::Uncertain) {
        confidence -= p.uncertain_penalty;
        reasons.push_back(bonus("Uncertain regime", -p.uncertain_penalty));
    }
    if (ind.atr_percent < p.low_volatility_atr_pct) {
        confidence -= p.low_volatility_penalty;
        reasons.push_back(bonus(fmt::format("Low volatility ({:.3f}%)", ind.atr_percent), -p.low_volatility_penalty));
    }

    signal.base_confidence = std::clamp(confidence, p.fallback_min, p.fallback_max);
    return signal;
}
