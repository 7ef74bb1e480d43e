#include "lifecycle/Proposal.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace lifecycle {

namespace {
using analytics::PayoffEngine;
using analytics::PricedLeg;

[[noreturn]] void violation(const std::string& message) {
    LOG_ERROR("ProposalBuilder contract violation: {}", message);
    throw ContractViolation(message);
}
} // namespace

std::string toString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::PENDING: return "pending";
        case ProposalStatus::APPROVED: return "approved";
        case ProposalStatus::REJECTED: return "rejected";
        case ProposalStatus::EXPIRED: return "expired";
    }
    return "pending";
}

nlohmann::json toJson(const Proposal& p) {
    nlohmann::json legs = nlohmann::json::array();
    for (size_t i = 0; i < p.legs.size(); ++i) {
        const auto& leg = p.legs[i];
        nlohmann::json j = {
            {"type", toString(leg.type)},
            {"side", toString(leg.side)},
            {"qty", leg.qty},
            {"entryPrice", leg.entry_price}
        };
        if (leg.strike) j["strike"] = *leg.strike;
        if (i < p.quotes.size()) {
            j["bid"] = p.quotes[i].bid;
            j["ask"] = p.quotes[i].ask;
        }
        legs.push_back(j);
    }

    return {
        {"proposalId", p.proposal_id},
        {"strategyId", p.strategy_id},
        {"strategyVersion", p.strategy_version},
        {"symbol", p.symbol},
        {"underlyingPrice", p.underlying_price},
        {"legs", legs},
        {"pricing", {
            {"netMid", p.pricing.net_mid},
            {"netBid", p.pricing.net_bid},
            {"netAsk", p.pricing.net_ask},
            {"spread", p.pricing.spread},
            {"spreadPct", p.pricing.spread_pct},
            {"type", p.pricing.is_credit ? "credit" : "debit"}
        }},
        {"risk", {
            {"maxRisk", p.risk.max_risk},
            {"maxProfit", p.risk.max_profit},
            {"breakevens", p.risk.breakevens},
            {"pop", p.risk.pop},
            {"riskRewardRatio", p.risk.risk_reward_ratio},
            {"capitalRequired", p.risk.capital_required}
        }},
        {"greeks", {
            {"delta", p.greeks.delta},
            {"gamma", p.greeks.gamma},
            {"theta", p.greeks.theta},
            {"vega", p.greeks.vega}
        }},
        {"confidence", p.confidence},
        {"status", toString(p.status)},
        {"createdAt", toEpochMs(p.created_at)},
        {"approvalDeadline", toEpochMs(p.approval_deadline)}
    };
}

ProposalBuilder::ProposalBuilder(analytics::PayoffEngine engine)
    : engine_(std::move(engine)) {}

Proposal ProposalBuilder::build(
    const std::string& proposal_id,
    const scoring::StrategySuggestion& suggestion,
    int strategy_version,
    const std::string& symbol,
    double underlying_price,
    const std::vector<LegQuote>& quotes,
    Timestamp created_at,
    Timestamp approval_deadline
) const {
    if (quotes.size() != suggestion.proposed_legs.size()) {
        violation("quote count does not match leg count for " + suggestion.strategy_id);
    }
    if (approval_deadline < created_at) {
        violation("approval deadline precedes creation time");
    }

    std::vector<PricedLeg> legs;
    legs.reserve(quotes.size());
    for (size_t i = 0; i < quotes.size(); ++i) {
        const auto& src = suggestion.proposed_legs[i];
        const auto& q = quotes[i];
        if (!std::isfinite(q.bid) || !std::isfinite(q.ask) || q.bid < 0.0 || q.ask < q.bid) {
            violation("leg " + std::to_string(i) + ": quote must satisfy 0 <= bid <= ask");
        }

        PricedLeg leg;
        leg.type = src.type;
        leg.side = src.side;
        leg.qty = src.qty.value_or(1.0);
        leg.strike = src.strike;
        leg.expiration = src.expiry.value_or("");
        leg.entry_price = q.mid();
        legs.push_back(leg);
    }

    const auto payoff = engine_.computeTheoretical(symbol, underlying_price, legs);

    Proposal p;
    p.proposal_id = proposal_id;
    p.strategy_id = suggestion.strategy_id;
    p.strategy_version = strategy_version;
    p.symbol = symbol;
    p.underlying_price = underlying_price;
    p.legs = legs;
    p.quotes = quotes;
    p.pricing = price(legs, quotes);
    p.greeks = payoff.greeks;
    p.confidence = suggestion.confidence;
    p.created_at = created_at;
    p.approval_deadline = approval_deadline;

    p.risk.max_risk = std::max(0.0, -payoff.max_loss);
    p.risk.max_profit = payoff.max_profit;
    p.risk.breakevens = payoff.breakevens;
    p.risk.pop = payoff.pop;
    p.risk.risk_reward_ratio = p.risk.max_profit / std::max(p.risk.max_risk, 1.0);
    p.risk.capital_required = std::max(p.risk.max_risk, p.pricing.is_credit ? 0.0 : -p.pricing.net_mid);

    LOG_INFO("Proposal {} built for {} {}: net {:.2f} ({}), max risk {:.2f}, max profit {:.2f}",
             proposal_id, symbol, suggestion.strategy_id, p.pricing.net_mid,
             p.pricing.is_credit ? "credit" : "debit", p.risk.max_risk, p.risk.max_profit);
    return p;
}

ProposalPricing ProposalBuilder::price(const std::vector<PricedLeg>& legs, const std::vector<LegQuote>& quotes) {
    ProposalPricing pricing;
    const size_t n = std::min(legs.size(), quotes.size());

    for (size_t i = 0; i < n; ++i) {
        const auto& leg = legs[i];
        const auto& q = quotes[i];
        const double units = leg.qty * PayoffEngine::contractMultiplier(leg.type);
        const double sign = creditSign(leg.side);

        pricing.net_mid += sign * q.mid() * units;
        switch (leg.side) {
            case LegSide::SELL:
                pricing.net_bid += q.bid * units;
                pricing.net_ask += q.ask * units;
                break;
            case LegSide::BUY:
                pricing.net_bid -= q.ask * units;
                pricing.net_ask -= q.bid * units;
                break;
        }
    }

    pricing.spread = pricing.net_ask - pricing.net_bid;
    pricing.spread_pct = (std::abs(pricing.net_mid) > 1e-12) ? pricing.spread / std::abs(pricing.net_mid) : 0.0;
    pricing.is_credit = pricing.net_mid > 0.0;
    return pricing;
}

} // namespace lifecycle
} // namespace stratlab
