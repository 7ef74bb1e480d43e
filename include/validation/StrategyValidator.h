#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "validation/AccountContext.h"

namespace stratlab {
namespace validation {

// Issue codes
namespace codes {
constexpr const char* REQUIRED_FIELD = "REQUIRED_FIELD";
constexpr const char* INVALID_FORMAT = "INVALID_FORMAT";
constexpr const char* INVALID_RANGE = "INVALID_RANGE";
constexpr const char* INVALID_VALUE = "INVALID_VALUE";
constexpr const char* EMPTY_ARRAY = "EMPTY_ARRAY";
constexpr const char* MISSING_OPTIONAL = "MISSING_OPTIONAL";
constexpr const char* MISSING_GATE = "MISSING_GATE";
constexpr const char* CAPITAL_DISCIPLINE = "CAPITAL_DISCIPLINE";
constexpr const char* AUTOPILOT_INSUFFICIENT_HISTORY = "AUTOPILOT_INSUFFICIENT_HISTORY";
constexpr const char* AUTOPILOT_WIN_RATE_TOO_LOW = "AUTOPILOT_WIN_RATE_TOO_LOW";
constexpr const char* AUTOPILOT_PAPER_MODE = "AUTOPILOT_PAPER_MODE";
constexpr const char* AUTOPILOT_NO_GATES = "AUTOPILOT_NO_GATES";
constexpr const char* LIQUIDITY_WARNING = "LIQUIDITY_WARNING";
} // namespace codes

struct ValidationIssue {
    std::string field;
    std::string message;
    std::string code;
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    bool hasError(const std::string& code) const;
    bool hasWarning(const std::string& code) const;
    int countErrors(const std::string& code, const std::string& field) const;
};

nlohmann::json toJson(const ValidationResult& result);

// Structural + business-rule checks over a raw strategy document.
// Never throws: every problem is reported in the result.
class StrategyValidator {
public:
    explicit StrategyValidator(engine::ValidatorConfig config = engine::ValidatorConfig());

    ValidationResult validate(const nlohmann::json& document, const AccountContext& context) const;

    // Same as above with a paper-trading context and no history
    ValidationResult validate(const nlohmann::json& document) const;

private:
    void validateUniverse(const nlohmann::json& universe, ValidationResult& r) const;
    void validateEntry(const nlohmann::json& entry, ValidationResult& r) const;
    void validatePosition(const nlohmann::json& position, ValidationResult& r) const;
    void validateSizing(const nlohmann::json& sizing, ValidationResult& r) const;
    void validateExits(const nlohmann::json& exits, ValidationResult& r) const;
    void validateRisk(const nlohmann::json& risk, ValidationResult& r) const;
    void validateAutomation(const nlohmann::json& automation, ValidationResult& r) const;
    void validateBrokerRouting(const nlohmann::json& routing, ValidationResult& r) const;

    void validateCapitalDiscipline(const nlohmann::json& document, ValidationResult& r) const;
    void validateAutopilot(const nlohmann::json& document, const AccountContext& context, ValidationResult& r) const;
    void validateLiquidityAdvisory(const nlohmann::json& document, ValidationResult& r) const;

    engine::ValidatorConfig config_;
};

} // namespace validation
} // namespace stratlab
