#include "scoring.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    // Non-finite input lands on the floor of the range
    double clamp_to(double value, double lo, double hi) {
        if (!std::isfinite(value)) {
            return lo;
        }
        return std::clamp(value, lo, hi);
    }

    double lerp(double x, double x0, double x1, double y0, double y1) {
        return y0 + (x - x0) * (y1 - y0) / (x1 - x0);
    }

    bool contains(const std::vector<std::string>& list, const std::string& value) {
        return std::find(list.begin(), list.end(), value) != list.end();
    }
}

ConfidenceModulator::ConfidenceModulator(const Config& config) : config_(config) {}

PredictionSource ConfidenceModulator::select_source(const CandidateSignal& candidate, const IndicatorSet& ind,
                                                    const RegimeClassification& regime,
                                                    const std::optional<ExternalPrediction>& prediction) const {
    if (prediction && prediction->model_available) {
        return ExternalSource{clamp_to(prediction->confidence, 0.0, 100.0)};
    }
    return TechnicalFallback{
        technical_confidence(candidate.direction, ind, regime.regime, candidate.base_confidence)};
}

double ConfidenceModulator::technical_confidence(Direction direction, const IndicatorSet& ind, Regime regime,
                                                 double base_confidence) const {
    double confidence = base_confidence;

    // Trend strength
    if (ind.adx > 35) {
        confidence += 15;
    } else if (ind.adx > 25) {
        confidence += 10;
    } else if (ind.adx < 15) {
        confidence -= 10;
    }

    // Momentum relative to direction
    if (direction == Direction::Buy) {
        if (ind.rsi < 30) confidence += 15;
        else if (ind.rsi < 45) confidence += 8;
        else if (ind.rsi > 70) confidence -= 10;
    } else if (direction == Direction::Sell) {
        if (ind.rsi > 70) confidence += 15;
        else if (ind.rsi > 55) confidence += 8;
        else if (ind.rsi < 30) confidence -= 10;
    }

    if ((direction == Direction::Buy && ind.ema_fast > ind.ema_mid) ||
        (direction == Direction::Sell && ind.ema_fast < ind.ema_mid)) {
        confidence += 10;
    }

    if (ind.atr_percent >= 0.05 && ind.atr_percent <= 0.15) {
        confidence += 8;
    } else if (ind.atr_percent > 0.30) {
        confidence -= 10;
    } else if (ind.atr_percent < 0.03) {
        confidence -= 8;
    }

    if (regime == Regime::Trend) {
        confidence += 5;
    } else if (regime == Regime::Uncertain) {
        confidence -= 5;
    }

    return clamp_to(confidence, 0.0, 100.0);
}

double ConfidenceModulator::score_ml_confidence(double confidence) {
    double c = clamp_to(confidence, 0.0, 100.0);
    double score;
    if (c < 50) {
        score = c * 0.8;
    } else if (c < 70) {
        score = lerp(c, 50, 70, 40, 70);
    } else if (c < 85) {
        score = lerp(c, 70, 85, 70, 90);
    } else {
        score = lerp(c, 85, 100, 90, 100);
    }
    return clamp_to(score, 0.0, 100.0);
}

double ConfidenceModulator::score_technical_quality(Direction direction, const IndicatorSet& ind) const {
    double score = 50.0;

    if (direction == Direction::Buy) {
        if (ind.rsi < 30) score += 15;
        else if (ind.rsi < 50) score += 10;
        else if (ind.rsi > 70) score -= 15;
    } else if (direction == Direction::Sell) {
        if (ind.rsi > 70) score += 15;
        else if (ind.rsi > 50) score += 10;
        else if (ind.rsi < 30) score -= 15;
    }

    bool ema_bullish = ind.ema_fast > ind.ema_slow;
    if ((direction == Direction::Buy && ema_bullish) || (direction == Direction::Sell && !ema_bullish)) {
        score += 20;
    } else {
        score -= 10;
    }

    if (ind.adx > 25) {
        score += 15;
    } else if (ind.adx > 20) {
        score += 10;
    } else if (ind.adx < 15) {
        score -= 10;
    }

    return clamp_to(score, 0.0, 100.0);
}

double ConfidenceModulator::score_market_conditions(const IndicatorSet& ind, Regime regime, Session session) const {
    double score = 50.0;

    switch (regime) {
        case Regime::Trend: score += 20; break;
        case Regime::Range: score += 10; break;
        case Regime::Uncertain: score -= 10; break;
    }

    switch (session) {
        case Session::London:
        case Session::NewYork: score += 15; break;
        case Session::Asian: score += 5; break;
        case Session::Closed: break;
    }

    if (ind.atr_percent >= 0.05 && ind.atr_percent <= 0.15) {
        score += 15;
    } else if (ind.atr_percent > 0.30) {
        score -= 15;
    } else if (ind.atr_percent < 0.02) {
        score -= 10;
    }

    return clamp_to(score, 0.0, 100.0);
}

double ConfidenceModulator::score_mtf_confirmation(Direction direction, const IndicatorSet& ind) const {
    TrendBias want = direction == Direction::Buy ? TrendBias::Bullish : TrendBias::Bearish;
    double score = 50.0;
    score += ind.m15_trend == want ? 25.0 : -25.0;
    score += ind.h1_trend == want ? 25.0 : -25.0;
    return clamp_to(score, 0.0, 100.0);
}

double ConfidenceModulator::score_risk_factors(const std::string& symbol, std::optional<double> risk_score) const {
    const auto& w = config_.weighting;
    double score = 50.0;
    if (contains(w.stable_symbols, symbol)) {
        score += 20;
    } else if (contains(w.volatile_symbols, symbol)) {
        score += 5;
    }
    if (risk_score) {
        score -= (*risk_score - 3.0) * 10.0;
    }
    return clamp_to(score, 0.0, 100.0);
}

WeightResult ConfidenceModulator::weigh(const ModulationFactors& factors) const {
    const auto& w = config_.weighting;

    WeightResult result;
    result.components = factors;
    double total = factors.ml_confidence * w.ml_weight +
                   factors.technical_quality * w.technical_weight +
                   factors.market_conditions * w.market_weight +
                   factors.mtf_confirmation * w.mtf_weight +
                   factors.risk_factors * w.risk_weight;
    result.total_weight = clamp_to(total, 0.0, 100.0);
    result.recommendation = recommendation_for(result.total_weight);
    result.position_size_multiplier = position_multiplier_for(result.total_weight);
    return result;
}

Recommendation ConfidenceModulator::recommendation_for(double total_weight) const {
    const auto& w = config_.weighting;
    if (total_weight >= w.strong_buy_min) return Recommendation::StrongBuy;
    if (total_weight >= w.buy_min) return Recommendation::Buy;
    if (total_weight >= w.weak_min) return Recommendation::Weak;
    return Recommendation::Avoid;
}

double ConfidenceModulator::position_multiplier_for(double total_weight) {
    if (total_weight >= 80) return 2.0;
    if (total_weight >= 70) return 1.5;
    if (total_weight >= 60) return 1.0;
    if (total_weight >= 50) return 0.75;
    if (total_weight >= 40) return 0.5;
    return 0.25;
}

OverlayResult ConfidenceModulator::overlay(double base_intensity, double base_confidence,
                                           const SentimentAssessment& sentiment) {
    OverlayResult result;
    result.sentiment_multiplier = (sentiment.score - 3.0) * 0.1 * (0.5 + 0.5 * sentiment.confidence);
    result.risk_penalty = sentiment.risk > 3.0 ? -0.15 * sentiment.risk_confidence : 0.0;
    result.confidence_bonus = (base_confidence > 70 ? 0.05 : 0.0) + (sentiment.confidence > 0.7 ? 0.03 : 0.0);

    double intensity = base_intensity * result.sentiment_multiplier *
                       (1.0 + result.risk_penalty + result.confidence_bonus);
    result.final_intensity = clamp_to(intensity, 0.1, 2.0);
    return result;
}

ModulatedSignal ConfidenceModulator::modulate(const CandidateSignal& candidate, const IndicatorSet& ind,
                                              const SessionLevels& levels, const RegimeClassification& regime,
                                              const std::optional<ExternalPrediction>& prediction,
                                              const std::optional<SentimentAssessment>& sentiment,
                                              const CalibrationRecord& calibration) const {
    ModulatedSignal out;
    out.candidate = candidate;
    auto& signal = out.candidate;

    out.prediction_source = select_source(candidate, ind, regime, prediction);
    double source_confidence = 0.0;
    if (const auto* external = std::get_if<ExternalSource>(&out.prediction_source)) {
        source_confidence = external->confidence;
        signal.reasons.push_back(fmt::format("Model prediction {} @ {:.1f}%", to_string(prediction->direction),
                                             external->confidence));

        if (std::abs(external->confidence - 50.0) > config_.weighting.model_override_margin &&
            prediction->direction != Direction::Hold && prediction->direction != signal.direction) {
            signal.reasons.push_back(fmt::format("Model override: {} -> {}", to_string(signal.direction),
                                                 to_string(prediction->direction)));
            signal.direction = prediction->direction;
            // Structural hints belonged to the rejected setup
            signal.stop_mode = StopMode::Fallback;
            signal.structural_stop_hint.reset();
            signal.structural_target_hint.reset();
            signal.structural_level.reset();
        }
    } else {
        source_confidence = std::get<TechnicalFallback>(out.prediction_source).score;
        signal.reasons.push_back(prediction ? "Model unavailable: technical confidence calculation"
                                            : "Dynamic technical confidence");
    }
    signal.reasons.push_back(fmt::format("Prediction source {}", describe(out.prediction_source)));

    ModulationFactors factors;
    factors.ml_confidence = score_ml_confidence(source_confidence);
    factors.technical_quality = score_technical_quality(signal.direction, ind);
    factors.market_conditions = score_market_conditions(ind, regime.regime, levels.session);
    factors.mtf_confirmation = score_mtf_confirmation(signal.direction, ind);
    if (sentiment) {
        factors.sentiment_score = sentiment->score;
        factors.sentiment_confidence = sentiment->confidence;
        factors.risk_score = sentiment->risk;
    }
    factors.risk_factors = score_risk_factors(signal.symbol, factors.risk_score);

    WeightResult weight = weigh(factors);
    out.final_confidence = weight.total_weight;
    out.recommendation = weight.recommendation;
    out.position_size_multiplier = weight.position_size_multiplier;
    signal.reasons.push_back(fmt::format(
        "Weight {:.1f} (ml {:.0f}, tech {:.0f}, market {:.0f}, mtf {:.0f}, risk {:.0f}) -> {} x{:.2f}",
        weight.total_weight, factors.ml_confidence, factors.technical_quality, factors.market_conditions,
        factors.mtf_confirmation, factors.risk_factors, to_string(weight.recommendation),
        weight.position_size_multiplier));

    if (sentiment) {
        OverlayResult o = overlay(weight.position_size_multiplier, candidate.base_confidence, *sentiment);
        out.final_intensity = o.final_intensity;
        signal.reasons.push_back(fmt::format("Sentiment overlay: multiplier {:.3f}, risk {:.3f}, bonus {:.2f} -> {:.3f}",
                                             o.sentiment_multiplier, o.risk_penalty, o.confidence_bonus,
                                             o.final_intensity));
    } else {
        out.final_intensity = clamp_to(weight.position_size_multiplier, 0.1, 2.0);
    }

    out.confidence_threshold = calibration.threshold;
    out.calibration_version = calibration.version;
    out.actionable = out.final_confidence >= calibration.threshold;
    signal.reasons.push_back(fmt::format("Threshold {:.0f} (v{}): {}", calibration.threshold, calibration.version,
                                         out.actionable ? "actionable" : "below threshold"));

    spdlog::debug("{}: confidence {:.1f} {} via {}", signal.symbol, out.final_confidence,
                  to_string(out.recommendation), describe(out.prediction_source));
    return out;
}
