#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

enum class StrategyState {
    TrendBuyEval,
    TrendSellEval,
    RangeBuyEval,
    RangeSellEval,
    FallbackEval,
    Emit
};

std::string to_string(StrategyState s);

struct StrategySelection {
    CandidateSignal signal;
    // States visited before EMIT, in order
    std::vector<StrategyState> path;
};

// Picks a direction and base confidence from regime, indicators and levels.
// Always terminates in EMIT with BUY or SELL; the fallback state never holds.
class StrategySelector {
public:
    explicit StrategySelector(const Config& config);

    StrategySelection evaluate(const std::string& symbol, const IndicatorSet& ind,
                               const SessionLevels& levels, const RegimeClassification& regime) const;

    CandidateSignal select(const std::string& symbol, const IndicatorSet& ind,
                           const SessionLevels& levels, const RegimeClassification& regime) const;

private:
    StrategyState entry_state(const IndicatorSet& ind, const SessionLevels& levels,
                              const RegimeClassification& regime, std::vector<std::string>& reasons) const;

    std::optional<CandidateSignal> eval_trend(Direction direction, const IndicatorSet& ind,
                                              const SessionLevels& levels,
                                              std::vector<std::string>& reasons) const;

    std::optional<CandidateSignal> eval_range(Direction direction, const IndicatorSet& ind,
                                              const SessionLevels& levels,
                                              std::vector<std::string>& reasons) const;

    CandidateSignal eval_fallback(const IndicatorSet& ind, const RegimeClassification& regime,
                                  std::vector<std::string>& reasons) const;

    const Config& config_;
};
