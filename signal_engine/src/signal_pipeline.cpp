#include "signal_pipeline.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {
    // Series are ordered by timestamp at ingestion
    CandleSeries up_to(const CandleSeries& series, TimePoint as_of) {
        auto end = std::upper_bound(series.begin(), series.end(), as_of,
                                    [](TimePoint t, const Candle& c) { return t < c.timestamp; });
        return CandleSeries(series.begin(), end);
    }
}

SignalPipeline::SignalPipeline(const Config& config, const CalibrationStore& calibration)
    : config_(config),
      calibration_(calibration),
      indicators_(config),
      levels_(config),
      regime_(config),
      strategy_(config),
      modulator_(config),
      risk_(config) {}

SignalRecord SignalPipeline::evaluate(const SignalRequest& request) const {
    const CandleSeries& all_m5 = request.series(kTimeframeM5);
    if (all_m5.empty()) {
        throw InsufficientDataError(kTimeframeM5, indicators_.required_m5(), 0);
    }

    // Bars after as_of never reach any step
    const TimePoint as_of = request.as_of.value_or(all_m5.back().timestamp);
    const CandleSeries m5 = up_to(all_m5, as_of);
    const CandleSeries m15 = up_to(request.series(kTimeframeM15), as_of);
    const CandleSeries h1 = up_to(request.series(kTimeframeH1), as_of);

    if (m5.empty()) {
        throw InsufficientDataError(kTimeframeM5, indicators_.required_m5(), 0);
    }

    double entry = m5.back().close;
    double spread = 0.0;
    if (request.quote) {
        entry = (request.quote->bid + request.quote->ask) / 2.0;
        spread = request.quote->ask - request.quote->bid;
    }

    const SymbolClass symbol_class = config_.symbol_class(request.symbol);

    IndicatorSet ind = indicators_.compute(m5, m15, h1, as_of, entry);
    SessionLevels levels = levels_.compute(m5, h1, symbol_class, as_of, entry);
    RegimeClassification regime = regime_.classify(ind);
    CandidateSignal candidate = strategy_.select(request.symbol, ind, levels, regime);

    auto calibration = calibration_.snapshot();
    ModulatedSignal signal = modulator_.modulate(candidate, ind, levels, regime, request.prediction,
                                                 request.sentiment, *calibration);

    RiskInput risk_input;
    risk_input.direction = signal.candidate.direction;
    risk_input.entry = entry;
    risk_input.atr = ind.atr;
    risk_input.spread = spread;
    risk_input.symbol_class = symbol_class;
    risk_input.stop_mode = signal.candidate.stop_mode;
    risk_input.target_hint = signal.candidate.structural_target_hint;
    risk_input.structural_level = signal.candidate.structural_level;

    RiskLevels risk = risk_.calculate(risk_input, signal.candidate.reasons);

    SignalRecord record;
    record.corr_id = request.corr_id;
    record.symbol = request.symbol;
    record.direction = signal.candidate.direction;
    record.confidence = signal.final_confidence;
    record.base_confidence = signal.candidate.base_confidence;
    record.recommendation = signal.recommendation;
    record.position_size_multiplier = signal.position_size_multiplier;
    record.final_intensity = signal.final_intensity;
    record.entry_price = risk.entry_price;
    record.stop_loss = risk.stop_loss;
    record.take_profit = risk.take_profit;
    record.risk_reward_ratio = risk.risk_reward_ratio;
    record.stop_distance_pips = risk.stop_distance_pips;
    record.regime = regime.regime;
    record.adx = regime.adx;
    record.choppiness = regime.choppiness;
    record.prediction_source = describe(signal.prediction_source);
    record.confidence_threshold = signal.confidence_threshold;
    record.calibration_version = signal.calibration_version;
    record.actionable = signal.actionable;
    record.as_of = as_of;
    record.reasons = std::move(signal.candidate.reasons);

    spdlog::info("{} {} conf={:.1f} {} entry={:.5f} sl={:.5f} tp={:.5f} regime={}{}",
                 record.symbol, to_string(record.direction), record.confidence,
                 to_string(record.recommendation), record.entry_price, record.stop_loss, record.take_profit,
                 to_string(record.regime), record.actionable ? " actionable" : "");
    return record;
}
