#include "config.hpp"
#include "util.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    template <typename T>
    void read_field(const json& section, const char* key, T& field) {
        if (section.contains(key) && !section[key].is_null()) {
            field = section[key].get<T>();
        }
    }

    const json& section_of(const json& root, const char* key) {
        static const json empty = json::object();
        if (root.contains(key) && root[key].is_object()) {
            return root[key];
        }
        return empty;
    }

    int get_env_int(const char* name, int default_value) {
        std::string value = util::get_env_var(name);
        if (value.empty()) {
            return default_value;
        }
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            spdlog::warn("Invalid integer value for {}: {}", name, value);
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        std::string value = util::get_env_var(name);
        if (value.empty()) {
            return default_value;
        }
        try {
            return std::stod(value);
        } catch (const std::exception&) {
            spdlog::warn("Invalid double value for {}: {}", name, value);
        }
        return default_value;
    }

    void read_class(const json& section, const char* key, SymbolClassParams& params) {
        const json& s = section_of(section, key);
        read_field(s, "pip_size", params.pip_size);
        read_field(s, "min_stop_pips", params.min_stop_pips);
        read_field(s, "round_number_step", params.round_number_step);
        read_field(s, "min_stop_pct", params.min_stop_pct);
    }

    void check_positive(double value, const char* name) {
        if (!(value > 0.0) || !std::isfinite(value)) {
            throw std::runtime_error(std::string(name) + " must be positive");
        }
    }
}

void Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Config file {} not found, using defaults and environment", path);
    } else {
        json root;
        try {
            file >> root;
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
        }

        read_field(root, "service_name", service_name);
        read_field(root, "log_level", log_level);
        read_field(root, "health_host", health_host);
        read_field(root, "health_port", health_port);
        read_field(root, "redis_url", redis_url);
        read_field(root, "stream_requests", stream_requests);
        read_field(root, "stream_signals", stream_signals);
        read_field(root, "consumer_group", consumer_group);
        read_field(root, "pg_dsn", pg_dsn);

        const json& ind = section_of(root, "indicators");
        read_field(ind, "ema_fast", indicators.ema_fast);
        read_field(ind, "ema_slow", indicators.ema_slow);
        read_field(ind, "ema_mid", indicators.ema_mid);
        read_field(ind, "trend_ema", indicators.trend_ema);
        read_field(ind, "rsi", indicators.rsi);
        read_field(ind, "atr", indicators.atr);
        read_field(ind, "adx", indicators.adx);
        read_field(ind, "choppiness", indicators.choppiness);
        read_field(ind, "vwap_fallback_bars", indicators.vwap_fallback_bars);

        const json& reg = section_of(root, "regime");
        read_field(reg, "adx_trend_threshold", regime.adx_trend_threshold);
        read_field(reg, "choppiness_trend_max", regime.choppiness_trend_max);
        read_field(reg, "choppiness_range_threshold", regime.choppiness_range_threshold);

        const json& ses = section_of(root, "sessions");
        read_field(ses, "london_open_hour", sessions.london_open_hour);
        read_field(ses, "ny_open_hour", sessions.ny_open_hour);
        read_field(ses, "ib_duration_minutes", sessions.ib_duration_minutes);
        read_field(ses, "breakout_window_minutes", sessions.breakout_window_minutes);
        read_field(ses, "asian_start_hour", sessions.asian_start_hour);
        read_field(ses, "london_start_hour", sessions.london_start_hour);
        read_field(ses, "ny_start_hour", sessions.ny_start_hour);
        read_field(ses, "ny_end_hour", sessions.ny_end_hour);

        const json& st = section_of(root, "strategy");
        read_field(st, "trend_base", strategy.trend_base);
        read_field(st, "range_base", strategy.range_base);
        read_field(st, "fallback_momentum_base", strategy.fallback_momentum_base);
        read_field(st, "fallback_alignment_base", strategy.fallback_alignment_base);
        read_field(st, "fallback_min", strategy.fallback_min);
        read_field(st, "fallback_max", strategy.fallback_max);
        read_field(st, "trend_buy_rsi_min", strategy.trend_buy_rsi_min);
        read_field(st, "trend_buy_rsi_max", strategy.trend_buy_rsi_max);
        read_field(st, "trend_sell_rsi_min", strategy.trend_sell_rsi_min);
        read_field(st, "trend_sell_rsi_max", strategy.trend_sell_rsi_max);
        read_field(st, "trend_min_atr_pct", strategy.trend_min_atr_pct);
        read_field(st, "pullback_tolerance_pct", strategy.pullback_tolerance_pct);
        read_field(st, "pullback_bonus", strategy.pullback_bonus);
        read_field(st, "ib_break_bonus", strategy.ib_break_bonus);
        read_field(st, "open_window_bonus", strategy.open_window_bonus);
        read_field(st, "mtf_alignment_bonus", strategy.mtf_alignment_bonus);
        read_field(st, "previous_period_proximity", strategy.previous_period_proximity);
        read_field(st, "previous_period_penalty", strategy.previous_period_penalty);
        read_field(st, "round_number_proximity_pct", strategy.round_number_proximity_pct);
        read_field(st, "round_number_penalty", strategy.round_number_penalty);
        read_field(st, "range_rsi_oversold", strategy.range_rsi_oversold);
        read_field(st, "range_rsi_overbought", strategy.range_rsi_overbought);
        read_field(st, "range_min_atr_pct", strategy.range_min_atr_pct);
        read_field(st, "ib_touch_tolerance", strategy.ib_touch_tolerance);
        read_field(st, "previous_period_confluence", strategy.previous_period_confluence);
        read_field(st, "range_previous_period_bonus", strategy.range_previous_period_bonus);
        read_field(st, "range_round_number_bonus", strategy.range_round_number_bonus);
        read_field(st, "fallback_buy_rsi_min", strategy.fallback_buy_rsi_min);
        read_field(st, "fallback_sell_rsi_max", strategy.fallback_sell_rsi_max);
        read_field(st, "uncertain_penalty", strategy.uncertain_penalty);
        read_field(st, "low_volatility_atr_pct", strategy.low_volatility_atr_pct);
        read_field(st, "low_volatility_penalty", strategy.low_volatility_penalty);

        const json& rk = section_of(root, "risk");
        read_class(rk, "major_fx", risk.major_fx);
        read_class(rk, "jpy_quoted", risk.jpy_quoted);
        read_class(rk, "metal", risk.metal);
        read_class(rk, "crypto", risk.crypto);
        read_field(rk, "crypto_bases", risk.crypto_bases);
        read_field(rk, "spread_safety_multiple", risk.spread_safety_multiple);
        read_field(rk, "trend_stop_atr", risk.trend_stop_atr);
        read_field(rk, "range_stop_atr", risk.range_stop_atr);
        read_field(rk, "fallback_stop_atr", risk.fallback_stop_atr);
        read_field(rk, "trend_reward_ratio", risk.trend_reward_ratio);
        read_field(rk, "fallback_reward_ratio", risk.fallback_reward_ratio);
        read_field(rk, "range_target_cap_atr", risk.range_target_cap_atr);
        read_field(rk, "range_default_target_atr", risk.range_default_target_atr);
        read_field(rk, "correction_stop_atr", risk.correction_stop_atr);
        read_field(rk, "correction_reward_ratio", risk.correction_reward_ratio);

        const json& w = section_of(root, "weighting");
        read_field(w, "ml_weight", weighting.ml_weight);
        read_field(w, "technical_weight", weighting.technical_weight);
        read_field(w, "market_weight", weighting.market_weight);
        read_field(w, "mtf_weight", weighting.mtf_weight);
        read_field(w, "risk_weight", weighting.risk_weight);
        read_field(w, "strong_buy_min", weighting.strong_buy_min);
        read_field(w, "buy_min", weighting.buy_min);
        read_field(w, "weak_min", weighting.weak_min);
        read_field(w, "model_override_margin", weighting.model_override_margin);
        read_field(w, "stable_symbols", weighting.stable_symbols);
        read_field(w, "volatile_symbols", weighting.volatile_symbols);

        const json& cal = section_of(root, "calibration");
        read_field(cal, "window_days", calibration.window_days);
        read_field(cal, "grid_min", calibration.grid_min);
        read_field(cal, "grid_max", calibration.grid_max);
        read_field(cal, "grid_step", calibration.grid_step);
        read_field(cal, "min_samples", calibration.min_samples);
        read_field(cal, "min_qualified", calibration.min_qualified);
        read_field(cal, "winrate_weight", calibration.winrate_weight);
        read_field(cal, "pips_weight", calibration.pips_weight);
        read_field(cal, "fetch_timeout_seconds", calibration.fetch_timeout_seconds);
        read_field(cal, "schedule_interval_minutes", calibration.schedule_interval_minutes);
        read_field(cal, "reload_interval_seconds", calibration.reload_interval_seconds);
        read_field(cal, "default_threshold", calibration.default_threshold);
    }

    load_from_env();
    validate();
}

void Config::load_from_env() {
    // Service configuration
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    log_level = util::get_env_var("LOG_LEVEL", log_level);
    health_host = util::get_env_var("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);

    // Redis configuration
    redis_url = util::get_env_var("REDIS_URL", redis_url);
    stream_requests = util::get_env_var("STREAM_REQUESTS", stream_requests);
    stream_signals = util::get_env_var("STREAM_SIGNALS", stream_signals);
    consumer_group = util::get_env_var("CONSUMER_GROUP", consumer_group);

    // PostgreSQL configuration
    pg_dsn = util::get_env_var("PG_DSN", pg_dsn);

    // Thresholds most often tuned per deployment
    regime.adx_trend_threshold = get_env_double("ADX_TREND_THRESHOLD", regime.adx_trend_threshold);
    regime.choppiness_range_threshold =
        get_env_double("CHOPPINESS_RANGE_THRESHOLD", regime.choppiness_range_threshold);
    sessions.london_open_hour = get_env_int("LONDON_OPEN_HOUR", sessions.london_open_hour);
    sessions.ny_open_hour = get_env_int("NY_OPEN_HOUR", sessions.ny_open_hour);

    calibration.window_days = get_env_int("CALIBRATION_WINDOW_DAYS", calibration.window_days);
    calibration.min_samples = get_env_int("CALIBRATION_MIN_SAMPLES", calibration.min_samples);
    calibration.fetch_timeout_seconds =
        get_env_int("CALIBRATION_FETCH_TIMEOUT_SECONDS", calibration.fetch_timeout_seconds);
    calibration.schedule_interval_minutes =
        get_env_int("CALIBRATION_INTERVAL_MINUTES", calibration.schedule_interval_minutes);
    calibration.default_threshold =
        get_env_double("DEFAULT_CONFIDENCE_THRESHOLD", calibration.default_threshold);

    std::string crypto = util::get_env_var("CRYPTO_BASES");
    if (!crypto.empty()) {
        risk.crypto_bases = util::split_string(crypto, ',');
    }
}

void Config::validate() const {
    const int periods[] = {indicators.ema_fast, indicators.ema_slow, indicators.ema_mid,
                           indicators.trend_ema, indicators.rsi, indicators.atr,
                           indicators.adx, indicators.choppiness, indicators.vwap_fallback_bars};
    for (int p : periods) {
        if (p < 1) {
            throw std::runtime_error("Indicator periods must be at least 1");
        }
    }
    if (indicators.choppiness < 2) {
        throw std::runtime_error("Choppiness period must be at least 2");
    }
    if (indicators.ema_fast >= indicators.ema_slow) {
        throw std::runtime_error("Fast EMA period must be shorter than slow EMA period");
    }

    if (regime.choppiness_trend_max > regime.choppiness_range_threshold) {
        throw std::runtime_error("Choppiness trend maximum must not exceed the range threshold");
    }

    auto check_hour = [](int hour, const char* name) {
        if (hour < 0 || hour > 24) {
            throw std::runtime_error(std::string(name) + " must be between 0 and 24");
        }
    };
    check_hour(sessions.london_open_hour, "London open hour");
    check_hour(sessions.ny_open_hour, "New York open hour");
    check_hour(sessions.asian_start_hour, "Asian start hour");
    check_hour(sessions.london_start_hour, "London start hour");
    check_hour(sessions.ny_start_hour, "New York start hour");
    check_hour(sessions.ny_end_hour, "New York end hour");
    if (sessions.ib_duration_minutes < 1 || sessions.breakout_window_minutes < 0) {
        throw std::runtime_error("Initial balance duration must be positive");
    }

    if (strategy.fallback_min > strategy.fallback_max) {
        throw std::runtime_error("Fallback confidence band is inverted");
    }

    for (const auto* params : {&risk.major_fx, &risk.jpy_quoted, &risk.metal, &risk.crypto}) {
        check_positive(params->pip_size, "Pip size");
        check_positive(params->round_number_step, "Round number step");
        if (!(params->min_stop_pips >= 0.0) || !(params->min_stop_pct >= 0.0) || params->min_stop_pct >= 50.0 ||
            (params->min_stop_pips <= 0.0 && params->min_stop_pct <= 0.0)) {
            throw std::runtime_error("Minimum stop needs positive pips or a percent of entry below 50");
        }
    }
    check_positive(risk.trend_stop_atr, "Trend stop multiple");
    check_positive(risk.range_stop_atr, "Range stop multiple");
    check_positive(risk.fallback_stop_atr, "Fallback stop multiple");
    check_positive(risk.trend_reward_ratio, "Trend reward ratio");
    check_positive(risk.fallback_reward_ratio, "Fallback reward ratio");
    check_positive(risk.correction_stop_atr, "Correction stop multiple");
    check_positive(risk.correction_reward_ratio, "Correction reward ratio");

    double weight_sum = weighting.ml_weight + weighting.technical_weight +
                        weighting.market_weight + weighting.mtf_weight + weighting.risk_weight;
    if (std::abs(weight_sum - 1.0) > 1e-6) {
        throw std::runtime_error("Confidence weighting coefficients must sum to 1");
    }
    if (!(weighting.strong_buy_min >= weighting.buy_min && weighting.buy_min >= weighting.weak_min)) {
        throw std::runtime_error("Recommendation tier bands must be descending");
    }

    if (calibration.grid_step < 1 || calibration.grid_min > calibration.grid_max) {
        throw std::runtime_error("Calibration grid is empty");
    }
    if (calibration.window_days < 1 || calibration.min_samples < 1 || calibration.min_qualified < 1) {
        throw std::runtime_error("Calibration window and sample minimums must be positive");
    }
    if (calibration.fetch_timeout_seconds < 1) {
        throw std::runtime_error("Calibration fetch timeout must be at least 1 second");
    }

    spdlog::info("Configuration validated successfully");
}

const SymbolClassParams& Config::class_params(SymbolClass c) const {
    switch (c) {
        case SymbolClass::JpyQuoted: return risk.jpy_quoted;
        case SymbolClass::Metal: return risk.metal;
        case SymbolClass::Crypto: return risk.crypto;
        case SymbolClass::MajorFx: break;
    }
    return risk.major_fx;
}

SymbolClass Config::symbol_class(const std::string& symbol) const {
    std::string upper = util::to_upper(symbol);
    if (upper.find("XAU") != std::string::npos || upper.find("XAG") != std::string::npos) {
        return SymbolClass::Metal;
    }
    for (const auto& base : risk.crypto_bases) {
        if (!base.empty() && upper.rfind(util::to_upper(base), 0) == 0) {
            return SymbolClass::Crypto;
        }
    }
    if (upper.find("JPY") != std::string::npos) {
        return SymbolClass::JpyQuoted;
    }
    return SymbolClass::MajorFx;
}
