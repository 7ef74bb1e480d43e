#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace stratlab {
namespace spec {

enum class TargetClass { CURRENT, INVESTED, FUTURE };
enum class AllocationType { CASH, CASH_MAX_LOSS, MAX_LOSS };
enum class ExecutionMode { REQUIRES_APPROVAL, AUTOPILOT };
enum class RoutingOrderType { NET_MULTI, NET_DEBIT_OR_CREDIT_MULTI };
enum class LimitPriceStrategy { MID_WITH_TOLERANCE, BID, ASK, LAST };
enum class TimeInForce { DAY, IOC, FOK, GTC };

// ===== Universe =====

struct PriceRange {
    double min = 0.0;
    double max = 0.0;
};

struct UniverseFilters {
    std::optional<PriceRange> price_between;
    std::optional<double> min_stock_adv;
    std::optional<double> min_option_oi_per_strike;
    std::optional<double> max_option_spread;
    bool exclude_otc = false;
    bool exclude_hard_to_borrow = false;
    std::optional<int> earnings_within_days;
    bool halted = false;
};

struct Universe {
    std::vector<std::string> tickers;
    UniverseFilters filters;
    std::vector<TargetClass> target_classes;
    std::optional<int> max_candidates;
};

// ===== Entry =====

struct TimeWindow {
    std::string start;
    std::string end;
    std::string tz;
};

struct Entry {
    TimeWindow time_window;
    bool liquidity_checks = false;
};

// ===== Position =====

// Options carry either strike+expiry or a dte+delta target resolved later
struct Leg {
    LegType type = LegType::STOCK;
    LegSide side = LegSide::BUY;
    std::optional<double> qty;
    std::optional<double> strike;
    std::optional<std::string> expiry;
    std::optional<int> dte;
    std::optional<double> delta;
    std::optional<int> offset_strikes;
};

struct RollRule {
    std::optional<int> roll_if_dte_lt;
    std::optional<double> roll_if_delta_gt;
    std::optional<double> target_delta;
    std::optional<int> target_dte;
};

struct Position {
    std::vector<Leg> legs;
    std::optional<RollRule> short_call_roll;
    std::optional<RollRule> short_put_roll;
};

// ===== Sizing / Exits / Risk =====

struct Sizing {
    AllocationType allocation_type = AllocationType::CASH;
    std::optional<double> per_trade_cash;
    std::optional<double> risk_per_trade_pct;
    int max_concurrent_positions = 1;
    std::optional<double> portfolio_heat_max;
};

struct Exits {
    std::optional<double> profit_target_pct;
    std::optional<double> max_loss_pct;
    std::optional<int> time_exit_dte;
    std::optional<int> time_exit_before_earnings_days;
    bool oco_brackets = false;
};

struct CircuitBreakers {
    std::optional<double> vix_gt;
    std::optional<double> index_gap_pct_gt;
    bool suspend_new_trades = false;
    std::optional<double> spread_widen_gt;
    bool cancel_unfilled = false;
};

struct Risk {
    CircuitBreakers circuit_breakers;
    double slippage_budget_pct = 0.0;
    int max_order_reprices = 1;
};

// ===== Automation / Routing / Overrides =====

struct Automation {
    std::string scan_time;
    std::string propose_time;
    std::string approval_deadline;
    ExecutionMode execution_mode = ExecutionMode::REQUIRES_APPROVAL;
    std::optional<double> autopilot_if_win_rate_gt;
    std::optional<double> autopilot_if_sharpe_gt;
    std::optional<double> autopilot_max_dd_lt;

    bool hasPerformanceGate() const {
        return autopilot_if_win_rate_gt.has_value() ||
               autopilot_if_sharpe_gt.has_value() ||
               autopilot_max_dd_lt.has_value();
    }
};

struct BrokerRouting {
    RoutingOrderType order_type = RoutingOrderType::NET_MULTI;
    LimitPriceStrategy limit_price = LimitPriceStrategy::MID_WITH_TOLERANCE;
    double tolerance = 0.0;
    std::optional<TimeInForce> time_in_force;
};

struct UserOverrides {
    std::vector<std::string> editable_fields;
    bool allow_override_strikes = false;
    bool allow_override_qty = false;
    bool allow_override_dte = false;
    bool allow_risk_param_edits = false;
    bool show_advisory_warnings = true;
};

struct Strategy {
    std::string strategy_id;
    int version = 0;
    std::string name;
    std::string goal;
    Universe universe;
    Entry entry;
    Position position;
    Sizing sizing;
    Exits exits;
    Risk risk;
    Automation automation;
    BrokerRouting broker_routing;
    std::optional<UserOverrides> user_overrides;
};

// ===== String codecs =====

std::string toString(TargetClass value);
std::string toString(AllocationType value);
std::string toString(ExecutionMode value);
std::string toString(RoutingOrderType value);
std::string toString(LimitPriceStrategy value);
std::string toString(TimeInForce value);

std::optional<TargetClass> targetClassFromString(const std::string& value);
std::optional<AllocationType> allocationTypeFromString(const std::string& value);
std::optional<ExecutionMode> executionModeFromString(const std::string& value);
std::optional<RoutingOrderType> routingOrderTypeFromString(const std::string& value);
std::optional<LimitPriceStrategy> limitPriceStrategyFromString(const std::string& value);
std::optional<TimeInForce> timeInForceFromString(const std::string& value);

// ===== JSON conversion =====

// Expects a document that passed StrategyValidator; throws ContractViolation
// on fields it cannot map.
Strategy strategyFromJson(const nlohmann::json& document);
nlohmann::json strategyToJson(const Strategy& strategy);

Leg legFromJson(const nlohmann::json& leg);
nlohmann::json legToJson(const Leg& leg);

} // namespace spec
} // namespace stratlab
