#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace stratlab {
namespace analytics {

// A concrete leg with a known entry price (stock fill or option premium per share)
struct PricedLeg {
    LegType type = LegType::STOCK;
    LegSide side = LegSide::BUY;
    double qty = 1.0;
    std::optional<double> strike;
    std::string expiration;
    double entry_price = 0.0;
};

struct TheoreticalPayoff {
    std::string symbol;
    double underlying_price = 0.0;
    std::vector<PayoffPoint> payoff_curve;
    std::vector<double> breakevens;
    double max_profit = 0.0;
    double max_loss = 0.0;
    double pop = 0.0;                               // percent of samples with P&L > 0
    Greeks greeks;
    std::vector<PayoffPoint> probability_distribution; // pnl field carries the scaled density
};

nlohmann::json toJson(const TheoreticalPayoff& payoff);

// Expiration payoff analytics over a sampled price window.
// Greeks are fixed per-type estimates, not a pricing model.
class PayoffEngine {
public:
    explicit PayoffEngine(engine::PayoffConfig config = engine::PayoffConfig());

    // Throws ContractViolation on empty legs, bad prices, option legs without strike
    TheoreticalPayoff computeTheoretical(
        const std::string& symbol,
        double underlying_price,
        const std::vector<PricedLeg>& legs
    ) const;

    std::vector<PayoffPoint> samplePayoffCurve(double underlying_price, const std::vector<PricedLeg>& legs) const;
    std::vector<PayoffPoint> probabilityDistribution(double underlying_price) const;

    const engine::PayoffConfig& config() const { return config_; }

    // ===== per-leg primitives (shared with PositionTracker) =====
    static double intrinsic(LegType type, double strike, double underlying_price);
    static double contractMultiplier(LegType type);
    static double legPnL(const PricedLeg& leg, double underlying_price);
    static Greeks estimateLegGreeks(LegType type, LegSide side, double qty, const engine::GreekEstimates& estimates);
    static Greeks aggregateGreeks(const std::vector<PricedLeg>& legs, const engine::GreekEstimates& estimates);
    static Greeks roundGreeks(const Greeks& greeks);

    // Interpolated zero crossings of a sampled curve, ascending
    static std::vector<double> findBreakevens(const std::vector<PayoffPoint>& curve);
    static double probabilityOfProfit(const std::vector<PayoffPoint>& curve);

    static void checkLegs(const std::vector<PricedLeg>& legs);

private:
    engine::PayoffConfig config_;
};

} // namespace analytics
} // namespace stratlab
