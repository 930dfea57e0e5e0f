#pragma once

#include "calibration.hpp"
#include "config.hpp"
#include "indicators.hpp"
#include "levels.hpp"
#include "regime.hpp"
#include "risk_levels.hpp"
#include "scoring.hpp"
#include "strategy.hpp"
#include "types.hpp"

// Request path: indicators -> levels -> regime -> strategy -> modulation -> risk.
// Pure apart from one calibration snapshot per request; never reads the clock.
class SignalPipeline {
public:
    SignalPipeline(const Config& config, const CalibrationStore& calibration);

    // Throws InsufficientDataError when any timeframe is too short
    SignalRecord evaluate(const SignalRequest& request) const;

private:
    const Config& config_;
    const CalibrationStore& calibration_;

    IndicatorEngine indicators_;
    LevelCalculator levels_;
    RegimeClassifier regime_;
    StrategySelector strategy_;
    ConfidenceModulator modulator_;
    RiskCalculator risk_;
};
