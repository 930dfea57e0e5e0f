#include "regime.hpp"
#include <spdlog/spdlog.h>

RegimeClassifier::RegimeClassifier(const Config& config) : config_(config) {}

RegimeClassification RegimeClassifier::classify(double adx, double choppiness) const {
    const auto& t = config_.regime;

    RegimeClassification result;
    result.adx = adx;
    result.choppiness = choppiness;

    if (adx > t.adx_trend_threshold && choppiness < t.choppiness_trend_max) {
        result.regime = Regime::Trend;
    } else if (choppiness > t.choppiness_range_threshold) {
        result.regime = Regime::Range;
    } else {
        result.regime = Regime::Uncertain;
    }

    spdlog::debug("Regime {} (adx={:.1f}, chop={:.1f})", to_string(result.regime), adx, choppiness);
    return result;
}

RegimeClassification RegimeClassifier::classify(const IndicatorSet& indicators) const {
    return classify(indicators.adx, indicators.choppiness);
}
