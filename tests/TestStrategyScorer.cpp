#include "common/Errors.h"
#include "scoring/StrategyCatalog.h"
#include "scoring/StrategyScorer.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace stratlab;
using scoring::Archetype;
using scoring::MarketSnapshot;
using scoring::StrategyCatalog;
using scoring::StrategyScorer;

namespace {
const Timestamp kAsOf = fromEpochMs(1750000000000);

// Sub-$4 name in a favorable setup for put sellers
MarketSnapshot cheapSnapshot() {
    MarketSnapshot s;
    s.symbol = "SNDL";
    s.current_price = 3.20;
    s.as_of = kAsOf;
    s.technicals.rsi = 35.0;
    s.technicals.iv_percentile = 65.0;
    s.options.atm_call_oi = 800.0;
    s.options.avg_spread = 0.08;
    s.earnings_date = kAsOf + std::chrono::hours(24 * 20);
    return s;
}

scoring::StrategyTemplate seed(const std::string& id) {
    auto t = StrategyCatalog::find(StrategyCatalog::seedTemplates(), id);
    assert(t.has_value());
    return *t;
}
} // namespace

int main() {
    const StrategyScorer scorer;

    // Rule contributions on a favorable snapshot
    {
        const auto snapshot = cheapSnapshot();

        auto pcs = scorer.score(seed("pc_spread_sub4_v1"), snapshot);
        assert(pcs.confidence == 100.0);
        assert(pcs.reasoning.size() == 6);

        // Collar: no put-side RSI bonus, no IV rule
        auto collar = scorer.score(seed("micro_collar_sub4_v1"), snapshot);
        assert(collar.confidence == 70.0);
        assert(collar.reasoning.size() == 4);

        // Out-of-range price stops scoring
        auto condor = scorer.score(seed("spy_iron_condor_v1"), snapshot);
        assert(condor.confidence == 0.0);
        assert(condor.reasoning.size() == 1);
        assert(condor.reasoning[0].find("outside target range") != std::string::npos);
    }

    // Every penalty applies; result clamps at zero
    {
        auto snapshot = cheapSnapshot();
        snapshot.options.atm_call_oi = 100.0;
        snapshot.options.avg_spread = 0.20;
        snapshot.technicals.rsi = 50.0;
        snapshot.technicals.iv_percentile = 30.0;
        snapshot.earnings_date = kAsOf + std::chrono::hours(24 * 5);

        auto result = scorer.score(seed("pc_spread_sub4_v1"), snapshot);
        assert(result.confidence == 0.0);
        assert(result.reasoning.size() == 5);
        assert(result.reasoning[3].find("Too close to earnings (5 days)") != std::string::npos);
    }

    // Put OI stands in when call OI is missing; missing inputs skip their rules
    {
        MarketSnapshot snapshot;
        snapshot.symbol = "X";
        snapshot.current_price = 2.0;
        snapshot.as_of = kAsOf;
        snapshot.options.atm_put_oi = 600.0;

        auto result = scorer.score(seed("csp_wheel_sub4_v1"), snapshot);
        assert(result.confidence == 45.0);
        assert(result.reasoning.size() == 2);
    }

    // Ranking keeps the top three, ties in catalog order
    {
        auto report = scorer.rank(StrategyCatalog::seedTemplates(), cheapSnapshot());
        assert(report.symbol == "SNDL");
        assert(report.suggestions.size() == 3);
        assert(report.suggestions[0].strategy_id == "pc_spread_sub4_v1");
        assert(report.suggestions[1].strategy_id == "csp_wheel_sub4_v1");
        assert(report.suggestions[2].strategy_id == "micro_collar_sub4_v1");
        for (size_t i = 1; i < report.suggestions.size(); ++i) {
            assert(report.suggestions[i - 1].confidence >= report.suggestions[i].confidence);
        }

        auto j = scoring::toJson(report);
        assert(j["suggestions"].size() == 3);
        assert(j["suggestions"][0]["archetype"] == "put_credit_spread");
        assert(j["analysis"]["riskLevel"] == "medium");
    }

    // Iron condor at 450
    {
        MarketSnapshot spy;
        spy.symbol = "SPY";
        spy.current_price = 450.0;
        spy.as_of = kAsOf;
        spy.technicals.rsi = 50.0;
        spy.technicals.iv_percentile = 40.0;
        spy.options.atm_call_oi = 12000.0;
        spy.options.avg_spread = 0.03;

        const auto tmpl = seed("spy_iron_condor_v1");
        auto score = scorer.score(tmpl, spy);
        assert(score.confidence == 50.0);

        auto s = scorer.propose(tmpl, spy.current_price, score);
        assert(scorer.atmStrike(spy.current_price) == 450.0);
        assert(s.proposed_legs.size() == 4);
        assert(*s.proposed_legs[0].strike == 440.0);
        assert(*s.proposed_legs[1].strike == 435.0);
        assert(*s.proposed_legs[2].strike == 460.0);
        assert(*s.proposed_legs[3].strike == 465.0);
        assert(s.max_risk == 350.0);
        assert(s.max_profit == 150.0);
        assert(s.breakevens.size() == 2);
        assert(s.breakevens[0] == 438.5);
        assert(s.breakevens[1] == 461.5);
        assert(std::abs(s.risk_reward_ratio - 150.0 / 350.0) < 1e-12);
    }

    // Structural formulas for the other archetypes
    {
        const scoring::ScoreResult none;

        auto pcs = scorer.propose(seed("pc_spread_sub4_v1"), 101.0, none);
        assert(*pcs.proposed_legs[0].strike == 95.0);
        assert(*pcs.proposed_legs[1].strike == 90.0);
        assert(pcs.max_risk == 350.0);
        assert(pcs.breakevens[0] == 93.5);

        auto csp = scorer.propose(seed("csp_wheel_sub4_v1"), 101.0, none);
        assert(csp.proposed_legs.size() == 1);
        assert(csp.max_risk == 95.0 * 100.0 - 150.0);
        assert(csp.breakevens[0] == 93.5);

        auto collar = scorer.propose(seed("micro_collar_sub4_v1"), 101.0, none);
        assert(collar.proposed_legs.size() == 3);
        assert(collar.proposed_legs[0].type == LegType::STOCK);
        assert(*collar.proposed_legs[0].qty == 100.0);
        assert(collar.max_risk == 500.0 && collar.max_profit == 500.0);
        assert(collar.breakevens.size() == 1 && collar.breakevens[0] == 101.0);
        assert(collar.risk_reward_ratio == 1.0);

        bool threw = false;
        try {
            scorer.propose(seed("pc_spread_sub4_v1"), 0.0, none);
        } catch (const ContractViolation&) {
            threw = true;
        }
        assert(threw);
    }

    // Configured top_n
    {
        engine::ScorerConfig config;
        config.top_n = 1;
        const StrategyScorer single(config);
        auto report = single.rank(StrategyCatalog::seedTemplates(), cheapSnapshot());
        assert(report.suggestions.size() == 1);
    }

    // Low-priced underlyings use the fine strike grid and a scaled credit
    {
        const scoring::ScoreResult none;
        assert(scorer.strikeIncrement(3.20) == 0.5);
        assert(scorer.strikeIncrement(101.0) == 5.0);
        assert(scorer.atmStrike(3.20) == 3.0);

        auto pcs = scorer.propose(seed("pc_spread_sub4_v1"), 3.20, none);
        assert(*pcs.proposed_legs[0].strike == 2.5);
        assert(*pcs.proposed_legs[1].strike == 2.0);
        assert(std::abs(pcs.max_risk - 35.0) < 1e-9);
        assert(std::abs(pcs.max_profit - 15.0) < 1e-9);
        assert(std::abs(pcs.breakevens[0] - 2.35) < 1e-9);

        auto csp = scorer.propose(seed("csp_wheel_sub4_v1"), 3.20, none);
        assert(*csp.proposed_legs[0].strike == 2.5);
        assert(std::abs(csp.max_risk - 235.0) < 1e-9);

        auto collar = scorer.propose(seed("micro_collar_sub4_v1"), 3.20, none);
        assert(*collar.proposed_legs[1].strike == 2.5);
        assert(*collar.proposed_legs[2].strike == 3.5);
        assert(collar.max_risk == 50.0 && collar.max_profit == 50.0);

        auto report = scorer.rank(StrategyCatalog::seedTemplates(), cheapSnapshot());
        assert(report.suggestions.size() == 3);
        for (const auto& s : report.suggestions) {
            assert(StrategyScorer::isTradable(s));
            assert(s.max_risk >= 0.0);
        }
    }

    // Proposals whose strikes fall to zero are skipped
    {
        auto s = cheapSnapshot();
        s.current_price = 0.80;
        auto report = scorer.rank(StrategyCatalog::seedTemplates(), s);
        // all score 0; the spread's long put and the condor's wings land at or below 0
        assert(report.suggestions.size() == 2);
        assert(report.suggestions[0].strategy_id == "micro_collar_sub4_v1");
        assert(report.suggestions[1].strategy_id == "csp_wheel_sub4_v1");

        auto pcs = scorer.propose(seed("pc_spread_sub4_v1"), 0.80, scoring::ScoreResult());
        assert(!StrategyScorer::isTradable(pcs));

        engine::ScorerConfig bad;
        bad.strike_increment = 0.0;
        bool threw = false;
        try {
            StrategyScorer broken(bad);
        } catch (const ContractViolation&) {
            threw = true;
        }
        assert(threw);
    }

    // Market analysis labels
    {
        MarketSnapshot s;
        auto neutral = StrategyScorer::analyze(s);
        assert(neutral.technical_setup == "Neutral");
        assert(neutral.iv_environment == "Normal");
        assert(neutral.risk_level == scoring::RiskLevel::MEDIUM);

        s.technicals.rsi = 25.0;
        s.technicals.iv_percentile = 80.0;
        auto stretched = StrategyScorer::analyze(s);
        assert(stretched.technical_setup == "Oversold - Bullish reversal potential");
        assert(stretched.iv_environment == "Elevated IV - Favorable for premium selling");
        assert(stretched.risk_level == scoring::RiskLevel::HIGH);

        s.technicals.rsi = 50.0;
        s.technicals.sma20 = 105.0;
        s.technicals.sma50 = 100.0;
        s.technicals.iv_percentile = 40.0;
        auto trend = StrategyScorer::analyze(s);
        assert(trend.technical_setup == "Uptrend - Bullish momentum");
        assert(trend.iv_environment == "Moderate IV (40th percentile)");
        assert(trend.risk_level == scoring::RiskLevel::MEDIUM);
    }

    // Archetype codecs
    {
        assert(scoring::archetypeFromString("iron_condor") == Archetype::IRON_CONDOR);
        assert(!scoring::archetypeFromString("strangle").has_value());
        assert(scoring::sellsPremium(Archetype::CASH_SECURED_PUT));
        assert(!scoring::sellsPremium(Archetype::PROTECTIVE_COLLAR));
    }

    std::cout << "[TEST] StrategyScorer PASSED\n";
    return 0;
}
