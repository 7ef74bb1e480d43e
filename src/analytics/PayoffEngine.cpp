#include "analytics/PayoffEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace analytics {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kBreakevenEpsilon = 1e-9;

double roundTo(double value, double factor) {
    return std::round(value * factor) / factor;
}

[[noreturn]] void violation(const std::string& message) {
    LOG_ERROR("PayoffEngine contract violation: {}", message);
    throw ContractViolation(message);
}

void checkUnderlying(double underlying_price) {
    if (!std::isfinite(underlying_price) || underlying_price <= 0.0) {
        violation("underlying price must be finite and positive");
    }
}
} // namespace

nlohmann::json toJson(const TheoreticalPayoff& payoff) {
    auto points = [](const std::vector<PayoffPoint>& list) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& p : list) {
            arr.push_back({{"price", p.price}, {"pnl", p.pnl}});
        }
        return arr;
    };

    return {
        {"symbol", payoff.symbol},
        {"underlyingPrice", payoff.underlying_price},
        {"payoffCurve", points(payoff.payoff_curve)},
        {"breakevens", payoff.breakevens},
        {"maxProfit", payoff.max_profit},
        {"maxLoss", payoff.max_loss},
        {"pop", payoff.pop},
        {"greeks", {
            {"delta", payoff.greeks.delta},
            {"gamma", payoff.greeks.gamma},
            {"theta", payoff.greeks.theta},
            {"vega", payoff.greeks.vega}
        }},
        {"probabilityDistribution", points(payoff.probability_distribution)}
    };
}

PayoffEngine::PayoffEngine(engine::PayoffConfig config)
    : config_(config) {
    if (config_.steps < 1 || !(config_.range_low_factor > 0.0) ||
        !(config_.range_high_factor > config_.range_low_factor) || !std::isfinite(config_.range_high_factor)) {
        violation("sampling window must satisfy 0 < low < high with at least one step");
    }
    if (!(config_.distribution_sigma_pct > 0.0) || !std::isfinite(config_.distribution_sigma_pct) ||
        !(config_.distribution_scale > 0.0) || !std::isfinite(config_.distribution_scale)) {
        violation("distribution sigma and scale must be finite and positive");
    }
}

TheoreticalPayoff PayoffEngine::computeTheoretical(
    const std::string& symbol,
    double underlying_price,
    const std::vector<PricedLeg>& legs
) const {
    checkUnderlying(underlying_price);
    checkLegs(legs);

    TheoreticalPayoff result;
    result.symbol = symbol;
    result.underlying_price = underlying_price;
    result.payoff_curve = samplePayoffCurve(underlying_price, legs);
    result.breakevens = findBreakevens(result.payoff_curve);

    const auto extrema = std::minmax_element(
        result.payoff_curve.begin(), result.payoff_curve.end(),
        [](const PayoffPoint& a, const PayoffPoint& b) { return a.pnl < b.pnl; });
    result.max_loss = extrema.first->pnl;
    result.max_profit = extrema.second->pnl;

    result.pop = probabilityOfProfit(result.payoff_curve);
    result.greeks = roundGreeks(aggregateGreeks(legs, config_.greeks));
    result.probability_distribution = probabilityDistribution(underlying_price);

    LOG_INFO("{} payoff: {} legs, max profit {:.2f}, max loss {:.2f}, {} breakeven(s), POP {:.1f}%",
             symbol, legs.size(), result.max_profit, result.max_loss, result.breakevens.size(), result.pop);
    return result;
}

std::vector<PayoffPoint> PayoffEngine::samplePayoffCurve(
    double underlying_price,
    const std::vector<PricedLeg>& legs
) const {
    const int steps = std::max(1, config_.steps);
    const double low = underlying_price * config_.range_low_factor;
    const double high = underlying_price * config_.range_high_factor;

    std::vector<PayoffPoint> curve;
    curve.reserve(static_cast<size_t>(steps) + 1);

    // Index-based sampling so the last point lands exactly on the upper bound
    for (int i = 0; i <= steps; ++i) {
        PayoffPoint point;
        point.price = low + (high - low) * static_cast<double>(i) / static_cast<double>(steps);
        for (const auto& leg : legs) {
            point.pnl += legPnL(leg, point.price);
        }
        curve.push_back(point);
    }
    return curve;
}

std::vector<PayoffPoint> PayoffEngine::probabilityDistribution(double underlying_price) const {
    checkUnderlying(underlying_price);

    const int steps = std::max(1, config_.steps);
    const double low = underlying_price * config_.range_low_factor;
    const double high = underlying_price * config_.range_high_factor;
    const double sigma = underlying_price * config_.distribution_sigma_pct;

    std::vector<PayoffPoint> distribution;
    distribution.reserve(static_cast<size_t>(steps) + 1);

    for (int i = 0; i <= steps; ++i) {
        const double price = low + (high - low) * static_cast<double>(i) / static_cast<double>(steps);
        const double z = (price - underlying_price) / sigma;
        const double density = std::exp(-0.5 * z * z) / (sigma * std::sqrt(2.0 * kPi));
        distribution.push_back(PayoffPoint{price, density * config_.distribution_scale});
    }
    return distribution;
}

double PayoffEngine::intrinsic(LegType type, double strike, double underlying_price) {
    switch (type) {
        case LegType::CALL: return std::max(0.0, underlying_price - strike);
        case LegType::PUT: return std::max(0.0, strike - underlying_price);
        case LegType::STOCK: return underlying_price;
    }
    return 0.0;
}

double PayoffEngine::contractMultiplier(LegType type) {
    switch (type) {
        case LegType::CALL:
        case LegType::PUT:
            return OPTION_MULTIPLIER;
        case LegType::STOCK:
            return 1.0;
    }
    return 1.0;
}

double PayoffEngine::legPnL(const PricedLeg& leg, double underlying_price) {
    const double sign = sideSign(leg.side);

    switch (leg.type) {
        case LegType::STOCK:
            return sign * (underlying_price - leg.entry_price) * leg.qty;
        case LegType::CALL:
        case LegType::PUT: {
            const double value = intrinsic(leg.type, leg.strike.value_or(0.0), underlying_price);
            return sign * (value - leg.entry_price) * leg.qty * OPTION_MULTIPLIER;
        }
    }
    return 0.0;
}

Greeks PayoffEngine::estimateLegGreeks(
    LegType type,
    LegSide side,
    double qty,
    const engine::GreekEstimates& estimates
) {
    const double sign = sideSign(side);
    Greeks g;

    switch (type) {
        case LegType::STOCK:
            g.delta = sign * qty;
            return g;
        case LegType::CALL:
            g = estimates.call;
            break;
        case LegType::PUT:
            g = estimates.put;
            break;
    }

    const double scale = sign * qty * OPTION_MULTIPLIER;
    g.delta *= scale;
    g.gamma *= scale;
    g.theta *= scale;
    g.vega *= scale;
    return g;
}

Greeks PayoffEngine::aggregateGreeks(const std::vector<PricedLeg>& legs, const engine::GreekEstimates& estimates) {
    Greeks total;
    for (const auto& leg : legs) {
        total += estimateLegGreeks(leg.type, leg.side, leg.qty, estimates);
    }
    return total;
}

Greeks PayoffEngine::roundGreeks(const Greeks& greeks) {
    Greeks r;
    r.delta = roundTo(greeks.delta, 100.0);
    r.gamma = roundTo(greeks.gamma, 1000.0);
    r.theta = roundTo(greeks.theta, 100.0);
    r.vega = roundTo(greeks.vega, 100.0);
    return r;
}

std::vector<double> PayoffEngine::findBreakevens(const std::vector<PayoffPoint>& curve) {
    std::vector<double> breakevens;

    for (size_t i = 1; i < curve.size(); ++i) {
        const auto& prev = curve[i - 1];
        const auto& curr = curve[i];

        const bool crosses = (prev.pnl <= 0.0 && curr.pnl >= 0.0) || (prev.pnl >= 0.0 && curr.pnl <= 0.0);
        if (!crosses) {
            continue;
        }

        const double magnitude = std::abs(prev.pnl) + std::abs(curr.pnl);
        double crossing = prev.price;
        if (magnitude > 0.0) {
            const double ratio = std::abs(prev.pnl) / magnitude;
            crossing = prev.price + ratio * (curr.price - prev.price);
        }

        // A sample sitting exactly on zero closes one pair and opens the next
        if (!breakevens.empty() && std::abs(breakevens.back() - crossing) <= kBreakevenEpsilon * std::max(1.0, crossing)) {
            continue;
        }
        breakevens.push_back(crossing);
    }
    return breakevens;
}

double PayoffEngine::probabilityOfProfit(const std::vector<PayoffPoint>& curve) {
    if (curve.empty()) {
        return 0.0;
    }
    const auto profitable = std::count_if(curve.begin(), curve.end(),
                                          [](const PayoffPoint& p) { return p.pnl > 0.0; });
    const double pct = static_cast<double>(profitable) / static_cast<double>(curve.size()) * 100.0;
    return roundTo(pct, 10.0);
}

void PayoffEngine::checkLegs(const std::vector<PricedLeg>& legs) {
    if (legs.empty()) {
        violation("at least one leg is required");
    }

    for (size_t i = 0; i < legs.size(); ++i) {
        const auto& leg = legs[i];
        const std::string label = "leg " + std::to_string(i);

        if (!std::isfinite(leg.qty) || leg.qty <= 0.0) {
            violation(label + ": qty must be finite and positive");
        }
        if (!std::isfinite(leg.entry_price)) {
            violation(label + ": entry price must be finite");
        }
        if (isOption(leg.type)) {
            if (!leg.strike || !std::isfinite(*leg.strike) || *leg.strike <= 0.0) {
                violation(label + ": option leg requires a positive strike");
            }
        }
    }
}

} // namespace analytics
} // namespace stratlab
