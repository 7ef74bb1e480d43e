#include "analytics/PayoffEngine.h"
#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>

int main() {
    using namespace stratlab;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Compiled-in defaults
    {
        auto payoff = config.getPayoffConfig();
        assert(payoff.steps == 100);
        assert(std::abs(payoff.range_low_factor - 0.6) < 1e-12);
        assert(std::abs(payoff.range_high_factor - 1.4) < 1e-12);
        assert(std::abs(payoff.greeks.call.delta - 0.50) < 1e-12);
        assert(std::abs(config.getTrackerConfig().greeks.put.delta + 0.48) < 1e-12);

        auto validator = config.getValidatorConfig();
        assert(validator.autopilot_min_history_days == 90);
        assert(std::abs(validator.autopilot_default_win_rate - 0.58) < 1e-12);
        assert(std::abs(validator.capital_discipline_price_ceiling - 4.0) < 1e-12);

        auto scorer = config.getScorerConfig();
        assert(scorer.top_n == 3);
        assert(std::abs(scorer.strike_increment - 5.0) < 1e-12);
        assert(config.getLogLevel() == "info");
    }

    // 2. Partial document overrides only the keys it names
    {
        nlohmann::json j = {
            {"logging", {{"log_level", "debug"}}},
            {"validation", {{"autopilot_min_history_days", 120}}},
            {"scoring", {{"top_n", 2}}},
            {"analytics", {{"greek_estimates", {{"call", {{"delta", 0.45}}}}}}}
        };
        config.apply(j);

        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "logs");
        assert(config.getValidatorConfig().autopilot_min_history_days == 120);
        assert(std::abs(config.getValidatorConfig().autopilot_default_win_rate - 0.58) < 1e-12);
        assert(config.getScorerConfig().top_n == 2);
        assert(std::abs(config.getPayoffConfig().greeks.call.delta - 0.45) < 1e-12);
        assert(std::abs(config.getPayoffConfig().greeks.call.gamma - 0.02) < 1e-12);
    }

    // 3. Broken sampling window falls back to defaults
    {
        config.reset();
        nlohmann::json j = {{"analytics", {{"steps", 0}, {"range_low_factor", 1.5}}}};
        config.apply(j);
        assert(config.getPayoffConfig().steps == 100);
        assert(std::abs(config.getPayoffConfig().range_low_factor - 0.6) < 1e-12);
    }

    // 4. Non-positive distribution width and scale fall back per key
    {
        config.reset();
        nlohmann::json j = {{"analytics", {{"distribution_sigma_pct", 0.0}, {"distribution_scale", -5.0}, {"steps", 50}}}};
        config.apply(j);
        auto payoff = config.getPayoffConfig();
        assert(std::abs(payoff.distribution_sigma_pct - 0.15) < 1e-12);
        assert(std::abs(payoff.distribution_scale - 1000.0) < 1e-12);
        assert(payoff.steps == 50);

        analytics::PayoffEngine engine(payoff);
        auto density = engine.probabilityDistribution(100.0);
        assert(density.size() == 51);
        for (const auto& point : density) {
            assert(std::isfinite(point.pnl));
        }
        assert(density[25].pnl > density[0].pnl);

        // Engines refuse a zero-width distribution built by hand
        payoff.distribution_sigma_pct = 0.0;
        bool threw = false;
        try {
            analytics::PayoffEngine broken(payoff);
        } catch (const ContractViolation&) {
            threw = true;
        }
        assert(threw);
    }

    // 5. Scoring grid and result count are range-checked
    {
        config.reset();
        nlohmann::json j = {{"scoring", {
            {"strike_increment", 0.0},
            {"low_price_strike_increment", -0.5},
            {"assumed_credit", -1.0},
            {"top_n", 0}
        }}};
        config.apply(j);
        auto scorer = config.getScorerConfig();
        assert(std::abs(scorer.strike_increment - 5.0) < 1e-12);
        assert(std::abs(scorer.low_price_strike_increment - 0.5) < 1e-12);
        assert(std::abs(scorer.assumed_credit - 1.5) < 1e-12);
        assert(scorer.top_n == 3);

        nlohmann::json again = {{"scoring", {{"top_n", -1}, {"strike_increment", 2.5}}}};
        config.apply(again);
        assert(config.getScorerConfig().top_n == 3);
        assert(std::abs(config.getScorerConfig().strike_increment - 2.5) < 1e-12);
    }

    // 6. Missing file keeps defaults
    {
        config.reset();
        config.load("/nonexistent/stratlab/config.json");
        assert(config.getPayoffConfig().steps == 100);
        assert(config.getEngineConfig().scorer.top_n == 3);
    }

    config.reset();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
