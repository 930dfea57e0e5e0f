#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <string>

// Turns a candidate into a modulated signal: prediction source selection,
// five-factor weighting, optional sentiment/risk overlay and the calibrated
// actionable threshold.
class ConfidenceModulator {
public:
    explicit ConfidenceModulator(const Config& config);

    // External when a model prediction is available, otherwise a technical score
    PredictionSource select_source(const CandidateSignal& candidate, const IndicatorSet& ind,
                                   const RegimeClassification& regime,
                                   const std::optional<ExternalPrediction>& prediction) const;

    double technical_confidence(Direction direction, const IndicatorSet& ind, Regime regime,
                                double base_confidence) const;

    // Factor scores, each in [0, 100]
    static double score_ml_confidence(double confidence);
    double score_technical_quality(Direction direction, const IndicatorSet& ind) const;
    double score_market_conditions(const IndicatorSet& ind, Regime regime, Session session) const;
    double score_mtf_confirmation(Direction direction, const IndicatorSet& ind) const;
    double score_risk_factors(const std::string& symbol, std::optional<double> risk_score) const;

    WeightResult weigh(const ModulationFactors& factors) const;
    Recommendation recommendation_for(double total_weight) const;
    static double position_multiplier_for(double total_weight);

    static OverlayResult overlay(double base_intensity, double base_confidence,
                                 const SentimentAssessment& sentiment);

    ModulatedSignal modulate(const CandidateSignal& candidate, const IndicatorSet& ind,
                             const SessionLevels& levels, const RegimeClassification& regime,
                             const std::optional<ExternalPrediction>& prediction,
                             const std::optional<SentimentAssessment>& sentiment,
                             const CalibrationRecord& calibration) const;

private:
    const Config& config_;
};
