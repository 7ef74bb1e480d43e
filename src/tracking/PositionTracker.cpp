#include "tracking/PositionTracker.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>

namespace stratlab {
namespace tracking {

namespace {
using analytics::PayoffEngine;

[[noreturn]] void violation(const std::string& position_id, const std::string& message) {
    LOG_ERROR("Position {}: {}", position_id, message);
    throw ContractViolation("position " + position_id + ": " + message);
}

void requireOpen(const PositionTracking& tracking, const char* operation) {
    if (tracking.isClosed()) {
        violation(tracking.position_id, std::string(operation) + " refused, position is closed");
    }
}

void checkMarks(const PositionTracking& tracking) {
    if (tracking.legs.empty()) {
        violation(tracking.position_id, "position has no legs");
    }
    for (const auto& leg : tracking.legs) {
        if (!std::isfinite(leg.actual_price) || !std::isfinite(leg.current_price) ||
            !std::isfinite(leg.theoretical_price)) {
            violation(tracking.position_id, "leg price is not finite");
        }
        if (!std::isfinite(leg.qty) || leg.qty <= 0.0) {
            violation(tracking.position_id, "leg qty must be positive");
        }
    }
}

// Per-share net premium, credit positive
double netPremium(const std::vector<PositionLeg>& legs, double PositionLeg::*price) {
    double total = 0.0;
    for (const auto& leg : legs) {
        total += creditSign(leg.side) * (leg.*price);
    }
    return total;
}

double legUnits(const PositionLeg& leg) {
    return leg.qty * PayoffEngine::contractMultiplier(leg.type);
}

double pctOf(double value, double base) {
    return (std::abs(base) > 1e-12) ? (value / std::abs(base) * 100.0) : 0.0;
}

nlohmann::json greeksJson(const Greeks& g) {
    return {{"delta", g.delta}, {"gamma", g.gamma}, {"theta", g.theta}, {"vega", g.vega}};
}
} // namespace

nlohmann::json toJson(const PositionTracking& tracking) {
    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : tracking.legs) {
        nlohmann::json j = {
            {"type", toString(leg.type)},
            {"side", toString(leg.side)},
            {"qty", leg.qty},
            {"theoreticalPrice", leg.theoretical_price},
            {"actualPrice", leg.actual_price},
            {"currentPrice", leg.current_price}
        };
        if (leg.strike) j["strike"] = *leg.strike;
        if (!leg.expiration.empty()) j["expiration"] = leg.expiration;
        if (leg.exit_price) j["exitPrice"] = *leg.exit_price;
        legs.push_back(j);
    }

    nlohmann::json j = {
        {"positionId", tracking.position_id},
        {"symbol", tracking.symbol},
        {"strategy", tracking.strategy_id},
        {"legs", legs},
        {"theoretical", {
            {"maxProfit", tracking.theoretical.max_profit},
            {"maxLoss", tracking.theoretical.max_loss},
            {"breakevens", tracking.theoretical.breakevens},
            {"pop", tracking.theoretical.pop},
            {"expectedValue", tracking.theoretical.expected_value},
            {"entryPrice", tracking.theoretical.entry_price},
            {"greeks", greeksJson(tracking.theoretical.greeks)}
        }},
        {"actual", {
            {"entryPrice", tracking.actual.entry_price},
            {"entrySlippage", tracking.actual.entry_slippage},
            {"currentPL", tracking.actual.current_pl},
            {"unrealizedPL", tracking.actual.unrealized_pl},
            {"realizedPL", tracking.actual.realized_pl},
            {"greeks", greeksJson(tracking.actual.greeks)}
        }},
        {"lastUpdated", toEpochMs(tracking.last_updated)}
    };
    if (tracking.closed_at) {
        j["closedAt"] = toEpochMs(*tracking.closed_at);
    }
    return j;
}

nlohmann::json toJson(const ExecutionQuality& quality) {
    nlohmann::json j = {
        {"score", quality.score},
        {"entrySlippagePct", quality.entry_slippage_pct},
        {"totalSlippage", quality.total_slippage}
    };
    if (quality.exit_slippage_pct) {
        j["exitSlippagePct"] = *quality.exit_slippage_pct;
    }
    return j;
}

PositionTracker::PositionTracker(engine::TrackerConfig config)
    : config_(config) {}

PositionTracking PositionTracker::open(
    const std::string& position_id,
    const std::string& strategy_id,
    const std::vector<PositionLeg>& legs,
    const analytics::TheoreticalPayoff& payoff,
    Timestamp proposed_at,
    Timestamp entered_at
) const {
    PositionTracking tracking;
    tracking.position_id = position_id;
    tracking.symbol = payoff.symbol;
    tracking.strategy_id = strategy_id;
    tracking.legs = legs;
    tracking.proposed_at = proposed_at;
    tracking.entered_at = entered_at;
    tracking.last_updated = entered_at;
    checkMarks(tracking);

    auto& t = tracking.theoretical;
    t.max_profit = payoff.max_profit;
    t.max_loss = payoff.max_loss;
    t.breakevens = payoff.breakevens;
    t.pop = payoff.pop;
    t.greeks = payoff.greeks;
    t.entry_price = netPremium(legs, &PositionLeg::theoretical_price);

    // Two-outcome expectation over the sampled extremes
    const double p = payoff.pop / 100.0;
    t.expected_value = p * payoff.max_profit + (1.0 - p) * payoff.max_loss;

    tracking.actual.greeks = currentGreeks(legs);
    return tracking;
}

PositionTracking PositionTracker::update(const PositionTracking& tracking, Timestamp now) const {
    requireOpen(tracking, "update");
    checkMarks(tracking);

    PositionTracking next = tracking;
    const double entry_value = netValue(next.legs, &PositionLeg::actual_price);
    const double current_value = netValue(next.legs, &PositionLeg::current_price);

    // Credit-spread convention: the position gains as the premium to close shrinks
    next.actual.unrealized_pl = entry_value - current_value;
    next.actual.current_pl = next.actual.unrealized_pl;
    next.actual.greeks = currentGreeks(next.legs);
    next.last_updated = now;
    return next;
}

PositionTracking PositionTracker::recordFill(const PositionTracking& tracking) const {
    requireOpen(tracking, "recordFill");
    checkMarks(tracking);
    if (tracking.actual.entry_recorded) {
        violation(tracking.position_id, "entry fill already recorded");
    }

    PositionTracking next = tracking;
    double slippage = 0.0;
    for (const auto& leg : next.legs) {
        slippage += leg.theoretical_price - leg.actual_price;
    }
    next.actual.entry_slippage = slippage;
    next.actual.entry_price = netPremium(next.legs, &PositionLeg::actual_price);
    next.actual.entry_recorded = true;

    LOG_INFO("Position {} filled: net {:.2f} vs theoretical {:.2f}, slippage {:.2f}",
             next.position_id, next.actual.entry_price, next.theoretical.entry_price, slippage);
    return next;
}

PositionTracking PositionTracker::close(
    const PositionTracking& tracking,
    const std::vector<double>& exit_prices,
    Timestamp closed_at
) const {
    requireOpen(tracking, "close");
    checkMarks(tracking);
    if (exit_prices.size() != tracking.legs.size()) {
        violation(tracking.position_id, "exit price count does not match leg count");
    }

    PositionTracking next = tracking;
    double realized = 0.0;
    double exit_slippage = 0.0;
    for (size_t i = 0; i < next.legs.size(); ++i) {
        auto& leg = next.legs[i];
        if (!std::isfinite(exit_prices[i])) {
            violation(next.position_id, "exit price is not finite");
        }
        leg.exit_price = exit_prices[i];
        realized += creditSign(leg.side) * (leg.actual_price - exit_prices[i]) * legUnits(leg);
        exit_slippage += leg.current_price - exit_prices[i];
    }

    next.actual.realized_pl = realized;
    next.actual.unrealized_pl = 0.0;
    next.actual.current_pl = realized;
    next.actual.exit_slippage = exit_slippage;
    next.actual.greeks = Greeks();
    next.closed_at = closed_at;
    next.last_updated = closed_at;

    LOG_INFO("Position {} closed: realized {:.2f}", next.position_id, realized);
    return next;
}

ExecutionQuality PositionTracker::executionQuality(const PositionTracking& tracking) const {
    ExecutionQuality q;
    const double pnl = tracking.isClosed() ? tracking.actual.realized_pl : tracking.actual.unrealized_pl;

    q.score = pctOf(pnl, tracking.theoretical.expected_value);
    q.entry_slippage_pct = pctOf(tracking.actual.entry_slippage, tracking.theoretical.entry_price);

    if (tracking.actual.exit_slippage) {
        const double exit_basis = netPremium(tracking.legs, &PositionLeg::current_price);
        q.exit_slippage_pct = pctOf(*tracking.actual.exit_slippage, exit_basis);
    }

    // Dollars, each leg weighted by qty and its contract multiplier
    double total = 0.0;
    for (const auto& leg : tracking.legs) {
        if (tracking.actual.entry_recorded) {
            total += (leg.theoretical_price - leg.actual_price) * legUnits(leg);
        }
        if (leg.exit_price) {
            total += (leg.current_price - *leg.exit_price) * legUnits(leg);
        }
    }
    q.total_slippage = total;
    return q;
}

GreeksComparison PositionTracker::compareGreeks(const PositionTracking& tracking) const {
    GreeksComparison c;
    c.theoretical = tracking.theoretical.greeks;
    c.actual = tracking.actual.greeks;

    Greeks variance;
    variance.delta = c.actual.delta - c.theoretical.delta;
    variance.gamma = c.actual.gamma - c.theoretical.gamma;
    variance.theta = c.actual.theta - c.theoretical.theta;
    variance.vega = c.actual.vega - c.theoretical.vega;
    c.variance = PayoffEngine::roundGreeks(variance);
    return c;
}

Greeks PositionTracker::currentGreeks(const std::vector<PositionLeg>& legs) const {
    Greeks total;
    for (const auto& leg : legs) {
        total += PayoffEngine::estimateLegGreeks(leg.type, leg.side, leg.qty, config_.greeks);
    }
    return PayoffEngine::roundGreeks(total);
}

double PositionTracker::netValue(const std::vector<PositionLeg>& legs, double PositionLeg::*price) {
    double total = 0.0;
    for (const auto& leg : legs) {
        total += creditSign(leg.side) * (leg.*price) * leg.qty * PayoffEngine::contractMultiplier(leg.type);
    }
    return total;
}

} // namespace tracking
} // namespace stratlab
