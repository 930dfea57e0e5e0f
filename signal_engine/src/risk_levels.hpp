#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct RiskInput {
    Direction direction = Direction::Hold;
    double entry = 0.0;
    double atr = 0.0;
    double spread = 0.0;
    SymbolClass symbol_class = SymbolClass::MajorFx;
    StopMode stop_mode = StopMode::Fallback;
    std::optional<double> target_hint;      // session VWAP for range trades
    std::optional<double> structural_level; // PDH for buys, PDL for sells
};

class RiskCalculator {
public:
    explicit RiskCalculator(const Config& config);

    // max(class pips, class percent of entry, spread safety multiple)
    double min_stop_distance(SymbolClass symbol_class, double entry, double spread) const;
    double stop_distance(const RiskInput& input) const;

    // Correction reasons are appended to reasons. Throws std::invalid_argument for HOLD.
    RiskLevels calculate(const RiskInput& input, std::vector<std::string>& reasons) const;

private:
    double take_profit_for(const RiskInput& input, double stop_dist) const;

    const Config& config_;
};
