#include "scoring/StrategyCatalog.h"

namespace stratlab {
namespace scoring {

namespace {
spec::Leg optionLeg(LegType type, LegSide side, int dte, double delta) {
    spec::Leg leg;
    leg.type = type;
    leg.side = side;
    leg.qty = 1.0;
    leg.dte = dte;
    leg.delta = delta;
    return leg;
}

spec::Leg stockLeg(LegSide side, double qty) {
    spec::Leg leg;
    leg.type = LegType::STOCK;
    leg.side = side;
    leg.qty = qty;
    return leg;
}

// Shared skeleton; each seed overrides what differs
spec::Strategy baseStrategy(const std::string& id, const std::string& name, const std::string& goal) {
    spec::Strategy s;
    s.strategy_id = id;
    s.version = 1;
    s.name = name;
    s.goal = goal;

    s.universe.filters.price_between = spec::PriceRange{1.0, 4.0};
    s.universe.filters.min_stock_adv = 2000000.0;
    s.universe.filters.min_option_oi_per_strike = 500.0;
    s.universe.filters.max_option_spread = 0.10;
    s.universe.filters.exclude_otc = true;
    s.universe.filters.exclude_hard_to_borrow = true;
    s.universe.filters.earnings_within_days = 7;
    s.universe.target_classes = {spec::TargetClass::CURRENT};
    s.universe.max_candidates = 20;

    s.entry.time_window = spec::TimeWindow{"09:45", "15:30", "America/New_York"};
    s.entry.liquidity_checks = true;

    s.sizing.allocation_type = spec::AllocationType::CASH_MAX_LOSS;
    s.sizing.risk_per_trade_pct = 0.02;
    s.sizing.max_concurrent_positions = 5;
    s.sizing.portfolio_heat_max = 0.10;

    s.exits.profit_target_pct = 0.50;
    s.exits.max_loss_pct = 0.50;
    s.exits.time_exit_dte = 7;
    s.exits.time_exit_before_earnings_days = 3;

    s.risk.circuit_breakers.vix_gt = 30.0;
    s.risk.circuit_breakers.suspend_new_trades = true;
    s.risk.slippage_budget_pct = 0.05;
    s.risk.max_order_reprices = 3;

    s.automation.scan_time = "08:30";
    s.automation.propose_time = "09:15";
    s.automation.approval_deadline = "09:40";
    s.automation.execution_mode = spec::ExecutionMode::REQUIRES_APPROVAL;

    s.broker_routing.order_type = spec::RoutingOrderType::NET_DEBIT_OR_CREDIT_MULTI;
    s.broker_routing.limit_price = spec::LimitPriceStrategy::MID_WITH_TOLERANCE;
    s.broker_routing.tolerance = 0.05;
    s.broker_routing.time_in_force = spec::TimeInForce::DAY;
    return s;
}
} // namespace

std::string toString(Archetype archetype) {
    switch (archetype) {
        case Archetype::PROTECTIVE_COLLAR: return "protective_collar";
        case Archetype::PUT_CREDIT_SPREAD: return "put_credit_spread";
        case Archetype::CASH_SECURED_PUT: return "cash_secured_put";
        case Archetype::IRON_CONDOR: return "iron_condor";
    }
    return "unknown";
}

std::optional<Archetype> archetypeFromString(const std::string& value) {
    if (value == "protective_collar") return Archetype::PROTECTIVE_COLLAR;
    if (value == "put_credit_spread") return Archetype::PUT_CREDIT_SPREAD;
    if (value == "cash_secured_put") return Archetype::CASH_SECURED_PUT;
    if (value == "iron_condor") return Archetype::IRON_CONDOR;
    return std::nullopt;
}

MomentumBias momentumBias(Archetype archetype) {
    switch (archetype) {
        case Archetype::PUT_CREDIT_SPREAD:
        case Archetype::CASH_SECURED_PUT:
            return MomentumBias::PUT_CENTRIC;
        case Archetype::PROTECTIVE_COLLAR:
            return MomentumBias::CALL_CENTRIC;
        case Archetype::IRON_CONDOR:
            return MomentumBias::NONE;
    }
    return MomentumBias::NONE;
}

bool sellsPremium(Archetype archetype) {
    switch (archetype) {
        case Archetype::PUT_CREDIT_SPREAD:
        case Archetype::CASH_SECURED_PUT:
        case Archetype::IRON_CONDOR:
            return true;
        case Archetype::PROTECTIVE_COLLAR:
            return false;
    }
    return false;
}

std::vector<StrategyTemplate> StrategyCatalog::seedTemplates() {
    std::vector<StrategyTemplate> catalog;

    {
        StrategyTemplate t;
        t.archetype = Archetype::PROTECTIVE_COLLAR;
        t.strategy = baseStrategy("micro_collar_sub4_v1", "Micro Protective Collar - Sub-$4",
                                  "Income with capped downside on cheap stocks");
        t.strategy.position.legs = {
            stockLeg(LegSide::BUY, 100.0),
            optionLeg(LegType::PUT, LegSide::BUY, 35, -0.20),
            optionLeg(LegType::CALL, LegSide::SELL, 14, 0.30),
        };
        t.strategy.sizing.allocation_type = spec::AllocationType::CASH;
        t.strategy.sizing.per_trade_cash = 500.0;
        t.strategy.sizing.risk_per_trade_pct.reset();
        spec::RollRule roll;
        roll.roll_if_dte_lt = 5;
        roll.roll_if_delta_gt = 0.60;
        roll.target_delta = 0.30;
        roll.target_dte = 14;
        t.strategy.position.short_call_roll = roll;
        catalog.push_back(t);
    }

    {
        StrategyTemplate t;
        t.archetype = Archetype::PUT_CREDIT_SPREAD;
        t.strategy = baseStrategy("pc_spread_sub4_v1", "Put Credit Spread - Sub-$4",
                                  "Defined-risk premium capture");
        t.strategy.position.legs = {
            optionLeg(LegType::PUT, LegSide::SELL, 28, -0.25),
            optionLeg(LegType::PUT, LegSide::BUY, 28, -0.10),
        };
        catalog.push_back(t);
    }

    {
        // Naked short put under $4: trips the capital-discipline rule by policy
        StrategyTemplate t;
        t.archetype = Archetype::CASH_SECURED_PUT;
        t.strategy = baseStrategy("csp_wheel_sub4_v1", "Cash-Secured Put Wheel - Sub-$4",
                                  "Premium income willing-to-own");
        t.strategy.position.legs = {
            optionLeg(LegType::PUT, LegSide::SELL, 28, -0.25),
        };
        t.strategy.sizing.allocation_type = spec::AllocationType::CASH;
        t.strategy.sizing.per_trade_cash = 400.0;
        t.strategy.sizing.risk_per_trade_pct.reset();
        catalog.push_back(t);
    }

    {
        StrategyTemplate t;
        t.archetype = Archetype::IRON_CONDOR;
        t.strategy = baseStrategy("spy_iron_condor_v1", "SPY Iron Condor - Range-bound",
                                  "High-probability income in low volatility");
        t.strategy.universe.tickers = {"SPY"};
        t.strategy.universe.filters.price_between = spec::PriceRange{300.0, 800.0};
        t.strategy.universe.filters.min_option_oi_per_strike = 5000.0;
        t.strategy.universe.filters.max_option_spread = 0.05;
        t.strategy.universe.filters.earnings_within_days.reset();
        t.strategy.exits.time_exit_before_earnings_days.reset();
        t.strategy.position.legs = {
            optionLeg(LegType::PUT, LegSide::SELL, 30, -0.20),
            optionLeg(LegType::PUT, LegSide::BUY, 30, -0.10),
            optionLeg(LegType::CALL, LegSide::SELL, 30, 0.20),
            optionLeg(LegType::CALL, LegSide::BUY, 30, 0.10),
        };
        catalog.push_back(t);
    }

    return catalog;
}

std::optional<StrategyTemplate> StrategyCatalog::find(
    const std::vector<StrategyTemplate>& catalog,
    const std::string& strategy_id
) {
    for (const auto& t : catalog) {
        if (t.strategy.strategy_id == strategy_id) {
            return t;
        }
    }
    return std::nullopt;
}

} // namespace scoring
} // namespace stratlab
