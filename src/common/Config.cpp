#include "common/Config.h"
#include "common/PathUtils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace stratlab {

namespace {
void readGreeks(const nlohmann::json& j, Greeks& g) {
    g.delta = j.value("delta", g.delta);
    g.gamma = j.value("gamma", g.gamma);
    g.theta = j.value("theta", g.theta);
    g.vega = j.value("vega", g.vega);
}

// Out-of-range values fall back to the compiled-in default
void requirePositive(double& value, double fallback, const char* key) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::cout << "Warning: " << key << " must be positive, using " << fallback << "." << std::endl;
        value = fallback;
    }
}

void readEstimates(const nlohmann::json& j, engine::GreekEstimates& e) {
    if (j.contains("call") && j["call"].is_object()) {
        readGreeks(j["call"], e.call);
    }
    if (j.contains("put") && j["put"].is_object()) {
        readGreeks(j["put"], e.put);
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    engine_config_ = engine::EngineConfig();
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cout << "Config loaded: samples=" << (engine_config_.payoff.steps + 1)
                  << ", autopilot_min_days=" << engine_config_.validator.autopilot_min_history_days
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("log_level", log_level_);
        log_dir_ = l.value("log_dir", log_dir_);
    }

    if (j.contains("analytics")) {
        auto& a = j["analytics"];
        auto& p = engine_config_.payoff;
        p.range_low_factor = a.value("range_low_factor", p.range_low_factor);
        p.range_high_factor = a.value("range_high_factor", p.range_high_factor);
        p.steps = a.value("steps", p.steps);
        p.distribution_sigma_pct = a.value("distribution_sigma_pct", p.distribution_sigma_pct);
        p.distribution_scale = a.value("distribution_scale", p.distribution_scale);
        if (a.contains("greek_estimates")) {
            readEstimates(a["greek_estimates"], p.greeks);
        }
        if (a.contains("tracking_greek_estimates")) {
            readEstimates(a["tracking_greek_estimates"], engine_config_.tracker.greeks);
        }

        if (p.steps < 1 || !std::isfinite(p.range_low_factor) || !std::isfinite(p.range_high_factor) ||
            p.range_low_factor <= 0.0 || p.range_high_factor <= p.range_low_factor) {
            std::cout << "Warning: invalid analytics sampling window, using defaults." << std::endl;
            const engine::PayoffConfig defaults;
            p.range_low_factor = defaults.range_low_factor;
            p.range_high_factor = defaults.range_high_factor;
            p.steps = defaults.steps;
        }
        const engine::PayoffConfig defaults;
        requirePositive(p.distribution_sigma_pct, defaults.distribution_sigma_pct, "distribution_sigma_pct");
        requirePositive(p.distribution_scale, defaults.distribution_scale, "distribution_scale");
    }

    if (j.contains("validation")) {
        auto& v = j["validation"];
        auto& c = engine_config_.validator;
        c.capital_discipline_price_ceiling =
            v.value("capital_discipline_price_ceiling", c.capital_discipline_price_ceiling);
        c.autopilot_min_history_days = v.value("autopilot_min_history_days", c.autopilot_min_history_days);
        c.autopilot_default_win_rate = v.value("autopilot_default_win_rate", c.autopilot_default_win_rate);
    }

    if (j.contains("scoring")) {
        auto& s = j["scoring"];
        auto& c = engine_config_.scorer;
        c.strike_increment = s.value("strike_increment", c.strike_increment);
        c.low_price_threshold = s.value("low_price_threshold", c.low_price_threshold);
        c.low_price_strike_increment = s.value("low_price_strike_increment", c.low_price_strike_increment);
        c.assumed_credit = s.value("assumed_credit", c.assumed_credit);
        c.top_n = s.value("top_n", c.top_n);
        c.earnings_buffer_days = s.value("earnings_buffer_days", c.earnings_buffer_days);
        c.rsi_oversold = s.value("rsi_oversold", c.rsi_oversold);
        c.rsi_overbought = s.value("rsi_overbought", c.rsi_overbought);
        c.iv_percentile_threshold = s.value("iv_percentile_threshold", c.iv_percentile_threshold);

        const engine::ScorerConfig defaults;
        requirePositive(c.strike_increment, defaults.strike_increment, "strike_increment");
        requirePositive(c.low_price_strike_increment, defaults.low_price_strike_increment,
                        "low_price_strike_increment");
        if (!std::isfinite(c.low_price_threshold) || c.low_price_threshold < 0.0) {
            std::cout << "Warning: low_price_threshold must be non-negative, using defaults." << std::endl;
            c.low_price_threshold = defaults.low_price_threshold;
        }
        if (!std::isfinite(c.assumed_credit) || c.assumed_credit < 0.0) {
            std::cout << "Warning: assumed_credit must be non-negative, using defaults." << std::endl;
            c.assumed_credit = defaults.assumed_credit;
        }
        if (c.top_n < 1) {
            std::cout << "Warning: top_n must be at least 1, using defaults." << std::endl;
            c.top_n = defaults.top_n;
        }
    }
}

} // namespace stratlab
