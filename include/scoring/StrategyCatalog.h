#pragma once

#include <optional>
#include <string>
#include <vector>
#include "spec/StrategySpec.h"

namespace stratlab {
namespace scoring {

enum class Archetype {
    PROTECTIVE_COLLAR,
    PUT_CREDIT_SPREAD,
    CASH_SECURED_PUT,
    IRON_CONDOR
};

// Which RSI extreme favors the template
enum class MomentumBias { NONE, PUT_CENTRIC, CALL_CENTRIC };

std::string toString(Archetype archetype);
std::optional<Archetype> archetypeFromString(const std::string& value);

MomentumBias momentumBias(Archetype archetype);
bool sellsPremium(Archetype archetype);

struct StrategyTemplate {
    spec::Strategy strategy;
    Archetype archetype = Archetype::PUT_CREDIT_SPREAD;
};

class StrategyCatalog {
public:
    // Built-in library: collar, put credit spread, cash-secured put (sub-$4), SPY iron condor
    static std::vector<StrategyTemplate> seedTemplates();

    static std::optional<StrategyTemplate> find(const std::vector<StrategyTemplate>& catalog,
                                                const std::string& strategy_id);
};

} // namespace scoring
} // namespace stratlab
