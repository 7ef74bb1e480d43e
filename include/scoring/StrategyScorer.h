#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "scoring/StrategyCatalog.h"

namespace stratlab {
namespace scoring {

struct Technicals {
    std::optional<double> sma20;
    std::optional<double> sma50;
    std::optional<double> sma200;
    std::optional<double> rsi;
    std::optional<double> iv_percentile;
    std::optional<double> hv_20;
};

struct OptionsLiquidity {
    std::optional<double> atm_call_oi;
    std::optional<double> atm_put_oi;
    std::optional<double> avg_spread;   // fraction of mid
    std::optional<double> avg_call_iv;
    std::optional<double> avg_put_iv;
};

// Market context for one symbol. Missing fields skip the rules that need them.
struct MarketSnapshot {
    std::string symbol;
    double current_price = 0.0;
    Technicals technicals;
    OptionsLiquidity options;
    std::optional<Timestamp> earnings_date;
    Timestamp as_of = Timestamp();
};

struct ScoreResult {
    double confidence = 0.0;            // [0, 100]
    std::vector<std::string> reasoning;
};

struct StrategySuggestion {
    std::string strategy_id;
    std::string strategy_name;
    Archetype archetype = Archetype::PUT_CREDIT_SPREAD;
    double confidence = 0.0;
    std::vector<std::string> reasoning;
    std::vector<spec::Leg> proposed_legs;
    double max_risk = 0.0;
    double max_profit = 0.0;
    std::vector<double> breakevens;
    double risk_reward_ratio = 0.0;
};

enum class RiskLevel { LOW, MEDIUM, HIGH };
std::string toString(RiskLevel level);

struct MarketAnalysis {
    std::string technical_setup = "Neutral";
    std::string iv_environment = "Normal";
    RiskLevel risk_level = RiskLevel::MEDIUM;
};

struct SuggestionReport {
    std::string symbol;
    double current_price = 0.0;
    std::vector<StrategySuggestion> suggestions;
    MarketAnalysis analysis;
};

nlohmann::json toJson(const StrategySuggestion& suggestion);
nlohmann::json toJson(const SuggestionReport& report);

// Rule-based template ranking. Each rule is independent; a price outside
// the template's range stops scoring for that template.
class StrategyScorer {
public:
    explicit StrategyScorer(engine::ScorerConfig config = engine::ScorerConfig());

    ScoreResult score(const StrategyTemplate& tmpl, const MarketSnapshot& snapshot) const;
    StrategySuggestion propose(const StrategyTemplate& tmpl, double current_price, const ScoreResult& score) const;

    // Top config.top_n templates by confidence, ties keep catalog order.
    // Proposals with a non-positive strike or negative max risk are skipped.
    SuggestionReport rank(const std::vector<StrategyTemplate>& catalog, const MarketSnapshot& snapshot) const;

    static MarketAnalysis analyze(const MarketSnapshot& snapshot);

    double strikeIncrement(double current_price) const;
    double atmStrike(double current_price) const;

    static bool isTradable(const StrategySuggestion& suggestion);

private:
    engine::ScorerConfig config_;
};

} // namespace scoring
} // namespace stratlab
