#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

enum class Direction { Buy, Sell, Hold };
enum class Regime { Trend, Range, Uncertain };
enum class TrendBias { Bullish, Bearish };
enum class Session { Asian, London, NewYork, Closed };
enum class StopMode { Trend, Range, Fallback };
enum class SymbolClass { MajorFx, JpyQuoted, Metal, Crypto };
enum class Recommendation { StrongBuy, Buy, Weak, Avoid };

std::string to_string(Direction d);
std::string to_string(Regime r);
std::string to_string(TrendBias t);
std::string to_string(Session s);
std::string to_string(StopMode m);
std::string to_string(SymbolClass c);
std::string to_string(Recommendation r);

std::optional<Direction> direction_from_string(const std::string& s);

// Timeframe keys used in requests
inline constexpr const char* kTimeframeM5 = "M5";
inline constexpr const char* kTimeframeM15 = "M15";
inline constexpr const char* kTimeframeH1 = "H1";

// Market data
struct Candle {
    TimePoint timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    static std::optional<Candle> from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

using CandleSeries = std::vector<Candle>;

struct Quote {
    double bid = 0.0;
    double ask = 0.0;
};

// Indicator snapshot for one request
struct IndicatorSet {
    double price = 0.0;
    double ema_fast = 0.0;
    double ema_slow = 0.0;
    double ema_mid = 0.0;
    double rsi = 50.0;
    double atr = 0.0;
    double atr_percent = 0.0;
    double adx = 0.0;
    double choppiness = 50.0;
    bool choppiness_degenerate = false;
    double vwap = 0.0;
    TrendBias m15_trend = TrendBias::Bearish;
    TrendBias h1_trend = TrendBias::Bearish;
};

struct InitialBalance {
    std::string session;
    double high = 0.0;
    double low = 0.0;
};

struct SessionLevels {
    std::optional<InitialBalance> initial_balance;
    std::optional<double> previous_period_high;
    std::optional<double> previous_period_low;
    double round_number_above = 0.0;
    double round_number_below = 0.0;
    Session session = Session::Closed;
    // Session whose post-open breakout window contains the evaluation time
    std::optional<std::string> open_breakout_window;
};

struct RegimeClassification {
    Regime regime = Regime::Uncertain;
    double adx = 0.0;
    double choppiness = 50.0;
};

struct CandidateSignal {
    std::string symbol;
    Direction direction = Direction::Hold;
    double base_confidence = 0.0;
    std::vector<std::string> reasons;
    StopMode stop_mode = StopMode::Fallback;
    std::optional<double> structural_stop_hint;
    std::optional<double> structural_target_hint;
    std::optional<double> structural_level;
};

// Optional inputs from external collaborators
struct ExternalPrediction {
    Direction direction = Direction::Hold;
    double confidence = 0.0;
    bool model_available = false;

    static std::optional<ExternalPrediction> from_json(const nlohmann::json& j);
};

struct SentimentAssessment {
    double score = 3.0;
    double confidence = 0.0;
    double risk = 3.0;
    double risk_confidence = 0.0;

    static std::optional<SentimentAssessment> from_json(const nlohmann::json& j);
};

struct ExternalSource {
    double confidence = 0.0;
};

struct TechnicalFallback {
    double score = 0.0;
};

using PredictionSource = std::variant<ExternalSource, TechnicalFallback>;

std::string describe(const PredictionSource& source);

struct ModulationFactors {
    double ml_confidence = 0.0;
    double technical_quality = 0.0;
    double market_conditions = 0.0;
    double mtf_confirmation = 0.0;
    double risk_factors = 0.0;
    std::optional<double> sentiment_score;
    std::optional<double> sentiment_confidence;
    std::optional<double> risk_score;
};

struct WeightResult {
    double total_weight = 0.0;
    ModulationFactors components;
    Recommendation recommendation = Recommendation::Avoid;
    double position_size_multiplier = 0.25;
};

struct OverlayResult {
    double sentiment_multiplier = 0.0;
    double risk_penalty = 0.0;
    double confidence_bonus = 0.0;
    double final_intensity = 0.1;
};

struct ModulatedSignal {
    CandidateSignal candidate;
    double final_confidence = 0.0;
    Recommendation recommendation = Recommendation::Avoid;
    double position_size_multiplier = 0.25;
    double final_intensity = 0.1;
    PredictionSource prediction_source = TechnicalFallback{};
    double confidence_threshold = 0.0;
    std::int64_t calibration_version = 0;
    bool actionable = false;
};

struct RiskLevels {
    double entry_price = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double risk_reward_ratio = 0.0;
    double stop_distance_pips = 0.0;
    bool corrected = false;
};

// Calibration data
struct LabeledOutcome {
    Direction direction = Direction::Buy;
    double confidence = 0.0;
    bool win = false;
    double win_pips = 0.0;
    double loss_pips = 0.0;
    TimePoint created_at;
};

struct ThresholdScore {
    int threshold = 0;
    int qualified = 0;
    double win_rate = 0.0;
    double avg_pips = 0.0;
    double score = 0.0;

    nlohmann::json to_json() const;
};

struct DirectionStats {
    int count = 0;
    int wins = 0;
    double win_rate = 0.0;
    double avg_pips = 0.0;

    nlohmann::json to_json() const;
};

struct CalibrationRecord {
    std::int64_t version = 0;
    double threshold = 0.0;
    int qualified_signal_count = 0;
    double blended_score = 0.0;
    double win_rate = 0.0;
    double avg_pips = 0.0;
    int sample_count = 0;
    DirectionStats buy;
    DirectionStats sell;
    std::vector<ThresholdScore> grid;
    TimePoint computed_at;

    // Grid results and direction breakdown, stored as a jsonb column
    nlohmann::json details_json() const;
    void load_details(const nlohmann::json& details);
    nlohmann::json to_json() const;
};

// Wire input
struct SignalRequest {
    std::string corr_id;
    std::string symbol;
    std::optional<TimePoint> as_of;
    std::optional<Quote> quote;
    std::map<std::string, CandleSeries> candles;
    std::optional<ExternalPrediction> prediction;
    std::optional<SentimentAssessment> sentiment;

    const CandleSeries& series(const std::string& timeframe) const;

    static std::optional<SignalRequest> from_json(const nlohmann::json& j);
};

// Wire output
struct SignalRecord {
    std::string corr_id;
    std::string symbol;
    Direction direction = Direction::Hold;
    double confidence = 0.0;
    double base_confidence = 0.0;
    Recommendation recommendation = Recommendation::Avoid;
    double position_size_multiplier = 0.0;
    double final_intensity = 0.0;
    double entry_price = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double risk_reward_ratio = 0.0;
    double stop_distance_pips = 0.0;
    Regime regime = Regime::Uncertain;
    double adx = 0.0;
    double choppiness = 0.0;
    std::string prediction_source;
    double confidence_threshold = 0.0;
    std::int64_t calibration_version = 0;
    bool actionable = false;
    TimePoint as_of;
    std::vector<std::string> reasons;

    nlohmann::json to_json() const;
};
