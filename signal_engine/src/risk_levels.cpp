#include "risk_levels.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    // Largest move below entry a rebuilt level may take; keeps it a price
    constexpr double kMaxDownsideFraction = 0.5;
}

RiskCalculator::RiskCalculator(const Config& config) : config_(config) {}

double RiskCalculator::min_stop_distance(SymbolClass symbol_class, double entry, double spread) const {
    const auto& params = config_.class_params(symbol_class);
    double floor = std::max(params.min_stop_pips * params.pip_size, params.min_stop_pct / 100.0 * entry);
    return std::max(floor, config_.risk.spread_safety_multiple * spread);
}

double RiskCalculator::stop_distance(const RiskInput& input) const {
    const auto& r = config_.risk;
    double multiple = r.fallback_stop_atr;
    switch (input.stop_mode) {
        case StopMode::Trend: multiple = r.trend_stop_atr; break;
        case StopMode::Range: multiple = r.range_stop_atr; break;
        case StopMode::Fallback: multiple = r.fallback_stop_atr; break;
    }
    return std::max(input.atr * multiple + input.spread, min_stop_distance(input.symbol_class, input.entry, input.spread));
}

double RiskCalculator::take_profit_for(const RiskInput& input, double stop_dist) const {
    const auto& r = config_.risk;
    const double sign = input.direction == Direction::Buy ? 1.0 : -1.0;

    switch (input.stop_mode) {
        case StopMode::Trend:
            return input.entry + sign * (r.trend_reward_ratio * (stop_dist - input.spread) + input.spread);
        case StopMode::Fallback:
            return input.entry + sign * (r.fallback_reward_ratio * (stop_dist - input.spread) + input.spread);
        case StopMode::Range:
            break;
    }

    // Mean reversion: aim at the session VWAP, else the structural level, capped in distance
    const double cap = r.range_target_cap_atr * input.atr + input.spread;
    std::optional<double> target = input.target_hint ? input.target_hint : input.structural_level;
    if (target && std::isfinite(*target)) {
        double offset = *target - input.entry;
        if (std::abs(offset) > cap) {
            offset = offset > 0 ? cap : -cap;
        }
        return input.entry + offset;
    }
    return input.entry + sign * (r.range_default_target_atr * input.atr + input.spread);
}

RiskLevels RiskCalculator::calculate(const RiskInput& in, std::vector<std::string>& reasons) const {
    if (in.direction == Direction::Hold) {
        throw std::invalid_argument("risk levels are undefined for HOLD");
    }
    if (!std::isfinite(in.entry) || in.entry <= 0.0) {
        throw std::invalid_argument(fmt::format("invalid entry price {}", in.entry));
    }

    RiskInput input = in;
    if (!std::isfinite(input.atr) || input.atr < 0.0) {
        spdlog::warn("Invalid ATR {} replaced with 0", input.atr);
        input.atr = 0.0;
    }
    if (!std::isfinite(input.spread) || input.spread < 0.0) {
        spdlog::warn("Invalid spread {} replaced with 0", input.spread);
        input.spread = 0.0;
    }

    const bool buy = input.direction == Direction::Buy;
    const double sign = buy ? 1.0 : -1.0;
    const auto& params = config_.class_params(input.symbol_class);
    const double min_dist = min_stop_distance(input.symbol_class, input.entry, input.spread);

    double stop_dist = stop_distance(input);
    RiskLevels levels;
    levels.entry_price = input.entry;
    levels.stop_loss = input.entry - sign * stop_dist;
    levels.take_profit = take_profit_for(input, stop_dist);

    // Direction-consistency correction: stop first, then target from the corrected risk.
    // A level at or below zero is not a price and counts as wrong-side.
    bool stop_ok = std::isfinite(levels.stop_loss) && levels.stop_loss > 0.0 &&
                   (buy ? levels.stop_loss < input.entry : levels.stop_loss > input.entry);
    if (!stop_ok) {
        double old = levels.stop_loss;
        double dist = std::max(input.atr * config_.risk.correction_stop_atr, min_dist);
        if (buy) {
            dist = std::min(dist, input.entry * kMaxDownsideFraction);
        }
        levels.stop_loss = input.entry - sign * dist;
        levels.corrected = true;
        spdlog::warn("Correcting {} stop {} -> {} (entry {})", to_string(input.direction), old,
                     levels.stop_loss, input.entry);
        reasons.push_back(fmt::format("SL corrected to {:.5f} (was not a valid adverse level)", levels.stop_loss));
    }

    bool target_ok = std::isfinite(levels.take_profit) && levels.take_profit > 0.0 &&
                     (buy ? levels.take_profit > input.entry : levels.take_profit < input.entry);
    if (!target_ok) {
        double old = levels.take_profit;
        double reward = std::abs(input.entry - levels.stop_loss) * config_.risk.correction_reward_ratio;
        if (!buy) {
            reward = std::min(reward, input.entry * kMaxDownsideFraction);
        }
        levels.take_profit = input.entry + sign * reward;
        levels.corrected = true;
        spdlog::warn("Correcting {} target {} -> {} (entry {})", to_string(input.direction), old,
                     levels.take_profit, input.entry);
        reasons.push_back(fmt::format("TP corrected to {:.5f} (was not a valid profitable level)", levels.take_profit));
    }

    double risk = std::abs(input.entry - levels.stop_loss);
    double reward = std::abs(levels.take_profit - input.entry);
    levels.risk_reward_ratio = risk > 0.0 ? reward / risk : 0.0;
    levels.stop_distance_pips = risk / params.pip_size;

    reasons.push_back(fmt::format("{} stop {:.1f} pips, R:R {:.2f}", to_string(input.stop_mode),
                                  levels.stop_distance_pips, levels.risk_reward_ratio));
    return levels;
}
