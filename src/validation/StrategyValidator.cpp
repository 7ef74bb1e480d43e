#include "validation/StrategyValidator.h"
#include "common/Logger.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace stratlab {
namespace validation {

namespace {
const std::vector<std::string> kLegTypes = {"STOCK", "CALL", "PUT"};
const std::vector<std::string> kLegSides = {"BUY", "SELL"};
const std::vector<std::string> kTargetClasses = {"current", "invested", "future"};
const std::vector<std::string> kAllocationTypes = {"cash", "cash_max_loss", "max_loss"};
const std::vector<std::string> kExecutionModes = {"requires_approval", "autopilot"};
const std::vector<std::string> kOrderTypes = {"NET_MULTI", "NET_DEBIT_OR_CREDIT_MULTI"};
const std::vector<std::string> kLimitPrices = {"mid_with_tolerance", "bid", "ask", "last"};
const std::vector<std::string> kTimeInForce = {"DAY", "IOC", "FOK", "GTC"};

bool present(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j[key].is_null();
}

bool oneOf(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string joined(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

std::string pct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

void addError(ValidationResult& r, const std::string& field, const std::string& message, const char* code) {
    r.errors.push_back(ValidationIssue{field, message, code});
}

void addWarning(ValidationResult& r, const std::string& field, const std::string& message, const char* code) {
    r.warnings.push_back(ValidationIssue{field, message, code});
}

void requireText(const nlohmann::json& j, const char* key, const std::string& field, ValidationResult& r) {
    if (!present(j, key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        addError(r, field, field + " is required", codes::REQUIRED_FIELD);
    }
}

// Optional enumerated string; returns the value when present and well-formed
std::string checkEnum(const nlohmann::json& j, const char* key, const std::string& field,
                      const std::vector<std::string>& allowed, bool required, ValidationResult& r) {
    if (!present(j, key)) {
        if (required) {
            addError(r, field, field + " is required", codes::REQUIRED_FIELD);
        }
        return "";
    }
    if (!j[key].is_string()) {
        addError(r, field, field + " must be a string", codes::INVALID_FORMAT);
        return "";
    }
    const std::string value = j[key].get<std::string>();
    if (!oneOf(allowed, value)) {
        addError(r, field, "Invalid " + std::string(key) + ": " + value + ". Must be one of: " + joined(allowed),
                 codes::INVALID_VALUE);
        return "";
    }
    return value;
}

// Optional number; false if absent or not numeric (non-numeric is reported)
bool readNumber(const nlohmann::json& j, const char* key, const std::string& field, double& out, ValidationResult& r) {
    if (!present(j, key)) {
        return false;
    }
    if (!j[key].is_number()) {
        addError(r, field, field + " must be a number", codes::INVALID_FORMAT);
        return false;
    }
    out = j[key].get<double>();
    return true;
}

void checkFraction(const nlohmann::json& j, const char* key, const std::string& field, ValidationResult& r) {
    double v = 0.0;
    if (readNumber(j, key, field, v, r) && (v < 0.0 || v > 1.0)) {
        addError(r, field, std::string(key) + " must be between 0 and 1", codes::INVALID_RANGE);
    }
}

void checkNonNegative(const nlohmann::json& j, const char* key, const std::string& field, ValidationResult& r) {
    double v = 0.0;
    if (readNumber(j, key, field, v, r) && v < 0.0) {
        addError(r, field, std::string(key) + " must be positive", codes::INVALID_VALUE);
    }
}

// Upper bound of a well-formed price_between filter
bool priceCeiling(const nlohmann::json& doc, double& ceiling) {
    if (!present(doc, "universe") || !present(doc["universe"], "filters")) {
        return false;
    }
    const auto& filters = doc["universe"]["filters"];
    if (!present(filters, "price_between")) {
        return false;
    }
    const auto& range = filters["price_between"];
    if (!range.is_array() || range.size() != 2 || !range[1].is_number()) {
        return false;
    }
    ceiling = range[1].get<double>();
    return true;
}

bool isOptionLeg(const nlohmann::json& leg) {
    if (!leg.is_object() || !leg.contains("type") || !leg["type"].is_string()) {
        return false;
    }
    const std::string type = leg["type"].get<std::string>();
    return type == "CALL" || type == "PUT";
}

bool legSideIs(const nlohmann::json& leg, const char* side) {
    return leg.is_object() && leg.contains("side") && leg["side"].is_string() &&
           leg["side"].get<std::string>() == side;
}
} // namespace

// ===== ValidationResult =====

bool ValidationResult::hasError(const std::string& code) const {
    return std::any_of(errors.begin(), errors.end(),
                       [&](const ValidationIssue& i) { return i.code == code; });
}

bool ValidationResult::hasWarning(const std::string& code) const {
    return std::any_of(warnings.begin(), warnings.end(),
                       [&](const ValidationIssue& i) { return i.code == code; });
}

int ValidationResult::countErrors(const std::string& code, const std::string& field) const {
    return static_cast<int>(std::count_if(errors.begin(), errors.end(), [&](const ValidationIssue& i) {
        return i.code == code && i.field == field;
    }));
}

nlohmann::json toJson(const ValidationResult& result) {
    auto issues = [](const std::vector<ValidationIssue>& list) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& i : list) {
            arr.push_back({{"field", i.field}, {"message", i.message}, {"code", i.code}});
        }
        return arr;
    };
    return {
        {"valid", result.valid},
        {"errors", issues(result.errors)},
        {"warnings", issues(result.warnings)}
    };
}

// ===== StrategyValidator =====

StrategyValidator::StrategyValidator(engine::ValidatorConfig config)
    : config_(config) {}

ValidationResult StrategyValidator::validate(const nlohmann::json& document) const {
    return validate(document, AccountContext());
}

ValidationResult StrategyValidator::validate(const nlohmann::json& doc, const AccountContext& context) const {
    ValidationResult r;

    if (!doc.is_object()) {
        addError(r, "", "strategy document must be a JSON object", codes::INVALID_FORMAT);
        r.valid = false;
        return r;
    }

    try {
        requireText(doc, "strategy_id", "strategy_id", r);
        requireText(doc, "name", "name", r);
        requireText(doc, "goal", "goal", r);

        struct Section {
            const char* key;
            void (StrategyValidator::*check)(const nlohmann::json&, ValidationResult&) const;
        };
        const Section sections[] = {
            {"universe", &StrategyValidator::validateUniverse},
            {"entry", &StrategyValidator::validateEntry},
            {"position", &StrategyValidator::validatePosition},
            {"sizing", &StrategyValidator::validateSizing},
            {"exits", &StrategyValidator::validateExits},
            {"risk", &StrategyValidator::validateRisk},
            {"automation", &StrategyValidator::validateAutomation},
            {"broker_routing", &StrategyValidator::validateBrokerRouting},
        };

        for (const auto& section : sections) {
            if (!present(doc, section.key)) {
                addError(r, section.key, std::string(section.key) + " is required", codes::REQUIRED_FIELD);
            } else if (!doc[section.key].is_object()) {
                addError(r, section.key, std::string(section.key) + " must be an object", codes::INVALID_FORMAT);
            } else {
                (this->*section.check)(doc[section.key], r);
            }
        }

        validateCapitalDiscipline(doc, r);
        validateAutopilot(doc, context, r);
        validateLiquidityAdvisory(doc, r);
    } catch (const nlohmann::json::exception& e) {
        addError(r, "", std::string("malformed strategy document: ") + e.what(), codes::INVALID_FORMAT);
    }

    r.valid = r.errors.empty();
    if (!r.valid) {
        const bool named = present(doc, "strategy_id") && doc["strategy_id"].is_string();
        LOG_WARN("Strategy {} failed validation: {} error(s), {} warning(s)",
                 named ? doc["strategy_id"].get<std::string>() : std::string("<unnamed>"),
                 r.errors.size(), r.warnings.size());
    }
    return r;
}

void StrategyValidator::validateUniverse(const nlohmann::json& universe, ValidationResult& r) const {
    if (!present(universe, "filters")) {
        addError(r, "universe.filters", "universe.filters is required", codes::REQUIRED_FIELD);
    } else {
        const auto& filters = universe["filters"];

        if (present(filters, "price_between")) {
            const auto& range = filters["price_between"];
            if (!range.is_array() || range.size() != 2 || !range[0].is_number() || !range[1].is_number()) {
                addError(r, "universe.filters.price_between", "price_between must be [min, max] array",
                         codes::INVALID_FORMAT);
            } else if (range[0].get<double>() >= range[1].get<double>()) {
                addError(r, "universe.filters.price_between", "min price must be less than max price",
                         codes::INVALID_RANGE);
            }
        }

        checkNonNegative(filters, "max_option_spread", "universe.filters.max_option_spread", r);
        checkNonNegative(filters, "min_option_oi_per_strike", "universe.filters.min_option_oi_per_strike", r);
    }

    if (present(universe, "target_classes")) {
        const auto& classes = universe["target_classes"];
        if (!classes.is_array()) {
            addError(r, "universe.target_classes", "target_classes must be an array", codes::INVALID_FORMAT);
            return;
        }
        for (const auto& cls : classes) {
            const std::string value = cls.is_string() ? cls.get<std::string>() : cls.dump();
            if (!oneOf(kTargetClasses, value)) {
                addError(r, "universe.target_classes",
                         "Invalid target class: " + value + ". Must be one of: " + joined(kTargetClasses),
                         codes::INVALID_VALUE);
            }
        }
    }
}

void StrategyValidator::validateEntry(const nlohmann::json& entry, ValidationResult& r) const {
    if (!present(entry, "time_window")) {
        addError(r, "entry.time_window", "time_window is required", codes::REQUIRED_FIELD);
    } else {
        const auto& tw = entry["time_window"];
        const bool complete = tw.is_object() &&
            present(tw, "start") && present(tw, "end") && present(tw, "tz");
        if (!complete) {
            addError(r, "entry.time_window", "time_window must have start, end, and tz", codes::REQUIRED_FIELD);
        }
    }

    if (!present(entry, "liquidity_checks")) {
        addWarning(r, "entry.liquidity_checks", "liquidity_checks not specified, defaulting to false",
                   codes::MISSING_OPTIONAL);
    } else if (!entry["liquidity_checks"].is_boolean()) {
        addError(r, "entry.liquidity_checks", "liquidity_checks must be a boolean", codes::INVALID_FORMAT);
    }
}

void StrategyValidator::validatePosition(const nlohmann::json& position, ValidationResult& r) const {
    if (!present(position, "legs") || !position["legs"].is_array()) {
        addError(r, "position.legs", "legs must be an array", codes::INVALID_FORMAT);
        return;
    }

    const auto& legs = position["legs"];
    if (legs.empty()) {
        addError(r, "position.legs", "At least one leg is required", codes::EMPTY_ARRAY);
        return;
    }

    for (size_t idx = 0; idx < legs.size(); ++idx) {
        const auto& leg = legs[idx];
        const std::string prefix = "position.legs[" + std::to_string(idx) + "]";

        if (!leg.is_object()) {
            addError(r, prefix, "leg must be an object", codes::INVALID_FORMAT);
            continue;
        }

        const std::string type = checkEnum(leg, "type", prefix + ".type", kLegTypes, true, r);
        checkEnum(leg, "side", prefix + ".side", kLegSides, true, r);

        double qty = 0.0;
        if (readNumber(leg, "qty", prefix + ".qty", qty, r) && qty <= 0.0) {
            addError(r, prefix + ".qty", "qty must be positive", codes::INVALID_VALUE);
        }

        if (type == "CALL" || type == "PUT") {
            if (!present(leg, "dte") && !present(leg, "strike") && !present(leg, "delta")) {
                addWarning(r, prefix, "Option leg should specify dte/delta or explicit strike",
                           codes::MISSING_OPTIONAL);
            }

            double delta = 0.0;
            if (readNumber(leg, "delta", prefix + ".delta", delta, r) && (delta < -1.0 || delta > 1.0)) {
                addError(r, prefix + ".delta", "delta must be between -1 and 1", codes::INVALID_RANGE);
            }

            double strike = 0.0;
            if (readNumber(leg, "strike", prefix + ".strike", strike, r) && strike <= 0.0) {
                addError(r, prefix + ".strike", "strike must be positive", codes::INVALID_VALUE);
            }
        }

        if (type == "STOCK" && !present(leg, "qty")) {
            addError(r, prefix + ".qty", "Stock leg must specify qty", codes::REQUIRED_FIELD);
        }
    }
}

void StrategyValidator::validateSizing(const nlohmann::json& sizing, ValidationResult& r) const {
    const std::string allocation =
        checkEnum(sizing, "allocation_type", "sizing.allocation_type", kAllocationTypes, true, r);

    if (allocation == "cash" && !present(sizing, "per_trade_cash")) {
        addError(r, "sizing.per_trade_cash", "per_trade_cash required when allocation_type is \"cash\"",
                 codes::REQUIRED_FIELD);
    }

    if ((allocation == "cash_max_loss" || allocation == "max_loss") && !present(sizing, "risk_per_trade_pct")) {
        addError(r, "sizing.risk_per_trade_pct", "risk_per_trade_pct required for risk-based allocation",
                 codes::REQUIRED_FIELD);
    }

    double max_positions = 0.0;
    if (!present(sizing, "max_concurrent_positions")) {
        addError(r, "sizing.max_concurrent_positions", "max_concurrent_positions is required",
                 codes::REQUIRED_FIELD);
    } else if (readNumber(sizing, "max_concurrent_positions", "sizing.max_concurrent_positions", max_positions, r) &&
               max_positions < 1.0) {
        addError(r, "sizing.max_concurrent_positions", "max_concurrent_positions must be at least 1",
                 codes::INVALID_VALUE);
    }

    checkFraction(sizing, "portfolio_heat_max", "sizing.portfolio_heat_max", r);
    checkFraction(sizing, "risk_per_trade_pct", "sizing.risk_per_trade_pct", r);
    checkNonNegative(sizing, "per_trade_cash", "sizing.per_trade_cash", r);
}

void StrategyValidator::validateExits(const nlohmann::json& exits, ValidationResult& r) const {
    checkFraction(exits, "profit_target_pct", "exits.profit_target_pct", r);
    checkFraction(exits, "max_loss_pct", "exits.max_loss_pct", r);
    checkNonNegative(exits, "time_exit_dte", "exits.time_exit_dte", r);
    checkNonNegative(exits, "time_exit_before_earnings_days", "exits.time_exit_before_earnings_days", r);
}

void StrategyValidator::validateRisk(const nlohmann::json& risk, ValidationResult& r) const {
    if (!present(risk, "circuit_breakers")) {
        addError(r, "risk.circuit_breakers", "circuit_breakers is required", codes::REQUIRED_FIELD);
    }

    if (!present(risk, "slippage_budget_pct")) {
        addError(r, "risk.slippage_budget_pct", "slippage_budget_pct is required", codes::REQUIRED_FIELD);
    } else {
        checkFraction(risk, "slippage_budget_pct", "risk.slippage_budget_pct", r);
    }

    double reprices = 0.0;
    if (!present(risk, "max_order_reprices")) {
        addError(r, "risk.max_order_reprices", "max_order_reprices is required", codes::REQUIRED_FIELD);
    } else if (readNumber(risk, "max_order_reprices", "risk.max_order_reprices", reprices, r) && reprices < 1.0) {
        addError(r, "risk.max_order_reprices", "max_order_reprices must be at least 1", codes::INVALID_VALUE);
    }
}

void StrategyValidator::validateAutomation(const nlohmann::json& automation, ValidationResult& r) const {
    for (const char* field : {"scan_time", "propose_time", "approval_deadline"}) {
        requireText(automation, field, std::string("automation.") + field, r);
    }

    const std::string mode =
        checkEnum(automation, "execution_mode", "automation.execution_mode", kExecutionModes, true, r);

    checkFraction(automation, "autopilot_if_win_rate_gt", "automation.autopilot_if_win_rate_gt", r);
    checkFraction(automation, "autopilot_max_dd_lt", "automation.autopilot_max_dd_lt", r);

    if (mode == "autopilot" && !present(automation, "autopilot_if_win_rate_gt")) {
        addWarning(r, "automation.autopilot_if_win_rate_gt",
                   "Autopilot enabled without win_rate gate - consider setting threshold", codes::MISSING_GATE);
    }
}

void StrategyValidator::validateBrokerRouting(const nlohmann::json& routing, ValidationResult& r) const {
    checkEnum(routing, "order_type", "broker_routing.order_type", kOrderTypes, true, r);
    checkEnum(routing, "limit_price", "broker_routing.limit_price", kLimitPrices, true, r);
    checkEnum(routing, "time_in_force", "broker_routing.time_in_force", kTimeInForce, false, r);

    if (!present(routing, "tolerance")) {
        addError(r, "broker_routing.tolerance", "tolerance is required", codes::REQUIRED_FIELD);
    } else {
        checkFraction(routing, "tolerance", "broker_routing.tolerance", r);
    }
}

// ===== Business rules =====

void StrategyValidator::validateCapitalDiscipline(const nlohmann::json& doc, ValidationResult& r) const {
    double ceiling = 0.0;
    if (!priceCeiling(doc, ceiling) || ceiling > config_.capital_discipline_price_ceiling) {
        return;
    }
    if (!present(doc, "position") || !present(doc["position"], "legs") || !doc["position"]["legs"].is_array()) {
        return;
    }

    const auto& legs = doc["position"]["legs"];
    const bool has_short_option = std::any_of(legs.begin(), legs.end(), [](const nlohmann::json& leg) {
        return isOptionLeg(leg) && legSideIs(leg, "SELL");
    });
    const bool has_long_option = std::any_of(legs.begin(), legs.end(), [](const nlohmann::json& leg) {
        return isOptionLeg(leg) && legSideIs(leg, "BUY");
    });

    if (has_short_option && !has_long_option) {
        addError(r, "position.legs",
                 "Sub-$4 strategies with short options must be cash-secured or have defined risk",
                 codes::CAPITAL_DISCIPLINE);
    }
}

void StrategyValidator::validateAutopilot(
    const nlohmann::json& doc,
    const AccountContext& context,
    ValidationResult& r
) const {
    if (!present(doc, "automation") || !doc["automation"].is_object()) {
        return;
    }
    const auto& automation = doc["automation"];
    if (!present(automation, "execution_mode") || !automation["execution_mode"].is_string() ||
        automation["execution_mode"].get<std::string>() != "autopilot") {
        return;
    }

    double threshold = config_.autopilot_default_win_rate;
    if (present(automation, "autopilot_if_win_rate_gt") && automation["autopilot_if_win_rate_gt"].is_number()) {
        threshold = automation["autopilot_if_win_rate_gt"].get<double>();
    }

    if (context.trading_mode == TradingMode::LIVE) {
        const std::string strategy_id =
            (present(doc, "strategy_id") && doc["strategy_id"].is_string()) ? doc["strategy_id"].get<std::string>() : "";
        const auto summary = summarizeHistory(context.trade_history, strategy_id, context.as_of);

        if (summary.days_active < static_cast<double>(config_.autopilot_min_history_days)) {
            addError(r, "automation.execution_mode",
                     "Autopilot requires " + std::to_string(config_.autopilot_min_history_days) +
                     "+ days of trade history in live mode",
                     codes::AUTOPILOT_INSUFFICIENT_HISTORY);
        }
        if (summary.winRate() < threshold) {
            addError(r, "automation.execution_mode",
                     "Win rate " + pct(summary.winRate()) + " below required " + pct(threshold),
                     codes::AUTOPILOT_WIN_RATE_TOO_LOW);
        }
    } else {
        addWarning(r, "automation.execution_mode",
                   "PAPER TRADING: Autopilot enabled for testing. This strategy will execute trades without approval.",
                   codes::AUTOPILOT_PAPER_MODE);
    }

    const bool has_gates = present(automation, "autopilot_if_win_rate_gt") ||
                           present(automation, "autopilot_if_sharpe_gt") ||
                           present(automation, "autopilot_max_dd_lt");
    if (!has_gates) {
        addWarning(r, "automation",
                   "Consider setting performance thresholds (win rate, Sharpe, max DD) for autopilot mode",
                   codes::AUTOPILOT_NO_GATES);
    }
}

void StrategyValidator::validateLiquidityAdvisory(const nlohmann::json& doc, ValidationResult& r) const {
    double ceiling = 0.0;
    if (!priceCeiling(doc, ceiling) || ceiling > config_.capital_discipline_price_ceiling) {
        return;
    }

    bool checks_on = false;
    if (present(doc, "entry") && present(doc["entry"], "liquidity_checks") &&
        doc["entry"]["liquidity_checks"].is_boolean()) {
        checks_on = doc["entry"]["liquidity_checks"].get<bool>();
    }
    if (!checks_on) {
        addWarning(r, "entry.liquidity_checks", "Liquidity checks strongly recommended for sub-$4 names",
                   codes::LIQUIDITY_WARNING);
    }
}

} // namespace validation
} // namespace stratlab
