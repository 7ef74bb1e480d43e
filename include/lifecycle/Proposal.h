#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/PayoffEngine.h"
#include "common/Types.h"
#include "scoring/StrategyScorer.h"

namespace stratlab {
namespace lifecycle {

enum class ProposalStatus { PENDING, APPROVED, REJECTED, EXPIRED };
std::string toString(ProposalStatus status);

struct LegQuote {
    double bid = 0.0;
    double ask = 0.0;

    double mid() const { return (bid + ask) / 2.0; }
};

// Dollar amounts, credit positive
struct ProposalPricing {
    double net_mid = 0.0;
    double net_bid = 0.0;       // natural side: sell at bid, buy at ask
    double net_ask = 0.0;       // far side: sell at ask, buy at bid
    double spread = 0.0;        // net_ask - net_bid
    double spread_pct = 0.0;    // spread / |net_mid|
    bool is_credit = false;
};

struct ProposalRisk {
    double max_risk = 0.0;      // positive dollars
    double max_profit = 0.0;
    std::vector<double> breakevens;
    double pop = 0.0;
    double risk_reward_ratio = 0.0;
    double capital_required = 0.0;
};

struct Proposal {
    std::string proposal_id;
    std::string strategy_id;
    int strategy_version = 0;
    std::string symbol;
    double underlying_price = 0.0;
    std::vector<analytics::PricedLeg> legs;
    std::vector<LegQuote> quotes;
    ProposalPricing pricing;
    ProposalRisk risk;
    Greeks greeks;
    double confidence = 0.0;
    ProposalStatus status = ProposalStatus::PENDING;
    Timestamp created_at = Timestamp();
    Timestamp approval_deadline = Timestamp();
};

nlohmann::json toJson(const Proposal& proposal);

// Packages a scored suggestion plus live quotes into a reviewable proposal
class ProposalBuilder {
public:
    explicit ProposalBuilder(analytics::PayoffEngine engine = analytics::PayoffEngine());

    // quotes[i] prices suggestion.proposed_legs[i]; legs are entered at mid
    Proposal build(
        const std::string& proposal_id,
        const scoring::StrategySuggestion& suggestion,
        int strategy_version,
        const std::string& symbol,
        double underlying_price,
        const std::vector<LegQuote>& quotes,
        Timestamp created_at,
        Timestamp approval_deadline
    ) const;

    static ProposalPricing price(const std::vector<analytics::PricedLeg>& legs, const std::vector<LegQuote>& quotes);

private:
    analytics::PayoffEngine engine_;
};

} // namespace lifecycle
} // namespace stratlab
