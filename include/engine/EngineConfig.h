#pragma once

#include "common/Types.h"

namespace stratlab {
namespace engine {

// Fixed per-type greek estimates (per share, before side/qty scaling)
struct GreekEstimates {
    Greeks call;
    Greeks put;
};

inline GreekEstimates theoreticalGreekEstimates() {
    GreekEstimates e;
    e.call = Greeks{0.50, 0.02, -0.05, 0.15};
    e.put = Greeks{-0.50, 0.02, -0.05, 0.15};
    return e;
}

inline GreekEstimates trackingGreekEstimates() {
    GreekEstimates e;
    e.call = Greeks{0.48, 0.018, -0.12, 0.14};
    e.put = Greeks{-0.48, 0.018, -0.12, 0.14};
    return e;
}

// Payoff sampling
struct PayoffConfig {
    double range_low_factor = 0.6;      // window start = price * 0.6
    double range_high_factor = 1.4;     // window end = price * 1.4
    int steps = 100;                    // 101 samples
    double distribution_sigma_pct = 0.15;
    double distribution_scale = 1000.0; // plotting only
    GreekEstimates greeks = theoreticalGreekEstimates();
};

struct TrackerConfig {
    GreekEstimates greeks = trackingGreekEstimates();
};

struct ValidatorConfig {
    double capital_discipline_price_ceiling = 4.0;
    int autopilot_min_history_days = 90;
    double autopilot_default_win_rate = 0.58;
};

struct ScorerConfig {
    double strike_increment = 5.0;
    double low_price_threshold = 5.0;   // below this price strikes use the fine grid
    double low_price_strike_increment = 0.5;
    double assumed_credit = 1.50;       // per share at strike_increment, scaled with the grid
    int top_n = 3;
    int earnings_buffer_days = 7;
    double rsi_oversold = 40.0;
    double rsi_overbought = 60.0;
    double iv_percentile_threshold = 50.0;
};

struct EngineConfig {
    PayoffConfig payoff;
    TrackerConfig tracker;
    ValidatorConfig validator;
    ScorerConfig scorer;
};

} // namespace engine
} // namespace stratlab
