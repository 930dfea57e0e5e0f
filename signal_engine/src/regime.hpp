#pragma once

#include "config.hpp"
#include "types.hpp"

class RegimeClassifier {
public:
    explicit RegimeClassifier(const Config& config);

    // TREND when ADX is strong and price action is not choppy, RANGE when
    // choppiness alone crosses the range threshold, UNCERTAIN otherwise
    RegimeClassification classify(double adx, double choppiness) const;

    RegimeClassification classify(const IndicatorSet& indicators) const;

private:
    const Config& config_;
};
