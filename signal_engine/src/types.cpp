#include "types.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

std::string to_string(Direction d) {
    switch (d) {
        case Direction::Buy: return "BUY";
        case Direction::Sell: return "SELL";
        case Direction::Hold: return "HOLD";
    }
    return "HOLD";
}

std::string to_string(Regime r) {
    switch (r) {
        case Regime::Trend: return "TREND";
        case Regime::Range: return "RANGE";
        case Regime::Uncertain: return "UNCERTAIN";
    }
    return "UNCERTAIN";
}

std::string to_string(TrendBias t) {
    return t == TrendBias::Bullish ? "BULLISH" : "BEARISH";
}

std::string to_string(Session s) {
    switch (s) {
        case Session::Asian: return "ASIAN";
        case Session::London: return "LONDON";
        case Session::NewYork: return "NY";
        case Session::Closed: return "CLOSED";
    }
    return "CLOSED";
}

std::string to_string(StopMode m) {
    switch (m) {
        case StopMode::Trend: return "TREND";
        case StopMode::Range: return "RANGE";
        case StopMode::Fallback: return "FALLBACK";
    }
    return "FALLBACK";
}

std::string to_string(SymbolClass c) {
    switch (c) {
        case SymbolClass::MajorFx: return "MAJOR_FX";
        case SymbolClass::JpyQuoted: return "JPY_QUOTED";
        case SymbolClass::Metal: return "METAL";
        case SymbolClass::Crypto: return "CRYPTO";
    }
    return "MAJOR_FX";
}

std::string to_string(Recommendation r) {
    switch (r) {
        case Recommendation::StrongBuy: return "STRONG_BUY";
        case Recommendation::Buy: return "BUY";
        case Recommendation::Weak: return "WEAK";
        case Recommendation::Avoid: return "AVOID";
    }
    return "AVOID";
}

std::optional<Direction> direction_from_string(const std::string& s) {
    std::string upper = util::to_upper(util::trim(s));
    if (upper == "BUY") return Direction::Buy;
    if (upper == "SELL") return Direction::Sell;
    if (upper == "HOLD") return Direction::Hold;
    return std::nullopt;
}

std::string describe(const PredictionSource& source) {
    if (const auto* external = std::get_if<ExternalSource>(&source)) {
        return fmt::format("EXTERNAL({:.1f})", external->confidence);
    }
    return fmt::format("TECHNICAL_FALLBACK({:.1f})", std::get<TechnicalFallback>(source).score);
}

std::optional<Candle> Candle::from_json(const json& j) {
    try {
        Candle c;
        c.timestamp = util::parse_iso8601(j.at("t").get<std::string>());
        c.open = j.at("o").get<double>();
        c.high = j.at("h").get<double>();
        c.low = j.at("l").get<double>();
        c.close = j.at("c").get<double>();
        c.volume = j.value("v", 0.0);

        if (c.high < c.low) {
            spdlog::warn("Rejecting candle at {}: high below low", j.at("t").get<std::string>());
            return std::nullopt;
        }
        return c;
    } catch (const std::exception& e) {
        spdlog::warn("Invalid candle: {}", e.what());
        return std::nullopt;
    }
}

json Candle::to_json() const {
    return json{
        {"t", util::format_timestamp(timestamp)},
        {"o", open},
        {"h", high},
        {"l", low},
        {"c", close},
        {"v", volume}
    };
}

std::optional<ExternalPrediction> ExternalPrediction::from_json(const json& j) {
    try {
        ExternalPrediction p;
        auto direction = direction_from_string(j.at("direction").get<std::string>());
        if (!direction) {
            spdlog::warn("Unknown prediction direction: {}", j.at("direction").get<std::string>());
            return std::nullopt;
        }
        p.direction = *direction;
        p.confidence = j.at("confidence").get<double>();
        p.model_available = j.value("model_available", true);
        return p;
    } catch (const std::exception& e) {
        spdlog::warn("Invalid prediction: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SentimentAssessment> SentimentAssessment::from_json(const json& j) {
    try {
        SentimentAssessment s;
        s.score = j.at("score").get<double>();
        s.confidence = j.at("confidence").get<double>();
        s.risk = j.value("risk", 3.0);
        s.risk_confidence = j.value("risk_confidence", s.confidence);
        return s;
    } catch (const std::exception& e) {
        spdlog::warn("Invalid sentiment assessment: {}", e.what());
        return std::nullopt;
    }
}

json ThresholdScore::to_json() const {
    return json{
        {"threshold", threshold},
        {"qualified", qualified},
        {"win_rate", win_rate},
        {"avg_pips", avg_pips},
        {"score", score}
    };
}

json DirectionStats::to_json() const {
    return json{
        {"count", count},
        {"wins", wins},
        {"win_rate", win_rate},
        {"avg_pips", avg_pips}
    };
}

json CalibrationRecord::details_json() const {
    json grid_json = json::array();
    for (const auto& entry : grid) {
        grid_json.push_back(entry.to_json());
    }
    return json{
        {"sample_count", sample_count},
        {"buy", buy.to_json()},
        {"sell", sell.to_json()},
        {"grid", grid_json}
    };
}

void CalibrationRecord::load_details(const json& details) {
    sample_count = details.value("sample_count", 0);

    auto read_stats = [](const json& j) {
        DirectionStats stats;
        stats.count = j.value("count", 0);
        stats.wins = j.value("wins", 0);
        stats.win_rate = j.value("win_rate", 0.0);
        stats.avg_pips = j.value("avg_pips", 0.0);
        return stats;
    };
    if (details.contains("buy")) buy = read_stats(details["buy"]);
    if (details.contains("sell")) sell = read_stats(details["sell"]);

    grid.clear();
    if (details.contains("grid") && details["grid"].is_array()) {
        for (const auto& entry : details["grid"]) {
            ThresholdScore s;
            s.threshold = entry.value("threshold", 0);
            s.qualified = entry.value("qualified", 0);
            s.win_rate = entry.value("win_rate", 0.0);
            s.avg_pips = entry.value("avg_pips", 0.0);
            s.score = entry.value("score", 0.0);
            grid.push_back(s);
        }
    }
}

json CalibrationRecord::to_json() const {
    return json{
        {"version", version},
        {"threshold", threshold},
        {"qualified_signal_count", qualified_signal_count},
        {"blended_score", blended_score},
        {"win_rate", win_rate},
        {"avg_pips", avg_pips},
        {"details", details_json()},
        {"computed_at", util::format_timestamp(computed_at)}
    };
}

const CandleSeries& SignalRequest::series(const std::string& timeframe) const {
    static const CandleSeries empty;
    auto it = candles.find(timeframe);
    return it != candles.end() ? it->second : empty;
}

std::optional<SignalRequest> SignalRequest::from_json(const json& j) {
    try {
        SignalRequest req;
        req.corr_id = j.value("corr_id", "");
        req.symbol = util::to_upper(j.at("symbol").get<std::string>());
        if (req.symbol.empty()) {
            spdlog::warn("Signal request {} has an empty symbol", req.corr_id);
            return std::nullopt;
        }

        if (j.contains("as_of") && !j["as_of"].is_null()) {
            req.as_of = util::parse_iso8601(j["as_of"].get<std::string>());
        }

        if (j.contains("quote") && j["quote"].is_object()) {
            Quote q;
            q.bid = j["quote"].at("bid").get<double>();
            q.ask = j["quote"].at("ask").get<double>();
            if (q.ask < q.bid) {
                spdlog::warn("Signal request {} has a crossed quote", req.corr_id);
                return std::nullopt;
            }
            req.quote = q;
        }

        const auto& candles_json = j.at("candles");
        for (auto it = candles_json.begin(); it != candles_json.end(); ++it) {
            const std::string timeframe = it.key();
            const auto& bars = it.value();
            CandleSeries series;
            series.reserve(bars.size());
            for (const auto& bar : bars) {
                auto candle = Candle::from_json(bar);
                if (!candle) {
                    return std::nullopt;
                }
                if (!series.empty() && candle->timestamp <= series.back().timestamp) {
                    spdlog::warn("Signal request {}: {} candles out of order", req.corr_id, timeframe);
                    return std::nullopt;
                }
                series.push_back(*candle);
            }
            req.candles[util::to_upper(timeframe)] = std::move(series);
        }

        if (j.contains("prediction") && j["prediction"].is_object()) {
            req.prediction = ExternalPrediction::from_json(j["prediction"]);
        }
        if (j.contains("sentiment") && j["sentiment"].is_object()) {
            req.sentiment = SentimentAssessment::from_json(j["sentiment"]);
        }

        return req;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse signal request: {}", e.what());
        return std::nullopt;
    }
}

json SignalRecord::to_json() const {
    return json{
        {"corr_id", corr_id},
        {"symbol", symbol},
        {"direction", to_string(direction)},
        {"confidence", confidence},
        {"base_confidence", base_confidence},
        {"recommendation", to_string(recommendation)},
        {"position_size_multiplier", position_size_multiplier},
        {"final_intensity", final_intensity},
        {"entry_price", entry_price},
        {"stop_loss", stop_loss},
        {"take_profit", take_profit},
        {"risk_reward_ratio", risk_reward_ratio},
        {"stop_distance_pips", stop_distance_pips},
        {"regime", to_string(regime)},
        {"adx", adx},
        {"choppiness", choppiness},
        {"prediction_source", prediction_source},
        {"confidence_threshold", confidence_threshold},
        {"calibration_version", calibration_version},
        {"actionable", actionable},
        {"as_of", util::format_timestamp(as_of)},
        {"reasons", reasons}
    };
}
