#include "scoring/StrategyScorer.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace stratlab {
namespace scoring {

namespace {
spec::Leg strikeLeg(LegType type, LegSide side, double strike, int dte, double delta) {
    spec::Leg leg;
    leg.type = type;
    leg.side = side;
    leg.qty = 1.0;
    leg.strike = strike;
    leg.dte = dte;
    leg.delta = delta;
    return leg;
}

int daysBetween(Timestamp from, Timestamp to) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    return static_cast<int>(std::floor(static_cast<double>(seconds) / 86400.0));
}

void checkPrice(double price) {
    if (!std::isfinite(price) || price <= 0.0) {
        LOG_ERROR("StrategyScorer: invalid current price {}", price);
        throw ContractViolation("current price must be finite and positive");
    }
}
} // namespace

std::string toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
    }
    return "medium";
}

nlohmann::json toJson(const StrategySuggestion& s) {
    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : s.proposed_legs) {
        legs.push_back(spec::legToJson(leg));
    }

    std::string reasoning;
    for (size_t i = 0; i < s.reasoning.size(); ++i) {
        if (i > 0) reasoning += "\n";
        reasoning += s.reasoning[i];
    }

    return {
        {"strategyId", s.strategy_id},
        {"strategyName", s.strategy_name},
        {"archetype", toString(s.archetype)},
        {"confidence", s.confidence},
        {"reasoning", reasoning},
        {"proposedLegs", legs},
        {"maxRisk", s.max_risk},
        {"maxProfit", s.max_profit},
        {"breakevens", s.breakevens},
        {"riskRewardRatio", s.risk_reward_ratio}
    };
}

nlohmann::json toJson(const SuggestionReport& report) {
    nlohmann::json suggestions = nlohmann::json::array();
    for (const auto& s : report.suggestions) {
        suggestions.push_back(toJson(s));
    }
    return {
        {"symbol", report.symbol},
        {"currentPrice", report.current_price},
        {"suggestions", suggestions},
        {"analysis", {
            {"technicalSetup", report.analysis.technical_setup},
            {"ivEnvironment", report.analysis.iv_environment},
            {"riskLevel", toString(report.analysis.risk_level)}
        }}
    };
}

StrategyScorer::StrategyScorer(engine::ScorerConfig config)
    : config_(config) {
    if (!(config_.strike_increment > 0.0) || !std::isfinite(config_.strike_increment) ||
        !(config_.low_price_strike_increment > 0.0) || !std::isfinite(config_.low_price_strike_increment)) {
        LOG_ERROR("StrategyScorer: invalid strike grid {} / {}", config_.strike_increment,
                  config_.low_price_strike_increment);
        throw ContractViolation("strike increments must be finite and positive");
    }
}

ScoreResult StrategyScorer::score(const StrategyTemplate& tmpl, const MarketSnapshot& snapshot) const {
    ScoreResult result;
    double score = 0.0;
    const auto& strategy = tmpl.strategy;
    const auto& filters = strategy.universe.filters;
    const double price = snapshot.current_price;

    // 1. Price range fit
    if (filters.price_between) {
        const double lo = filters.price_between->min;
        const double hi = filters.price_between->max;
        if (price >= lo && price <= hi) {
            score += 25.0;
            result.reasoning.push_back(fmt::format(
                "Price ${:.2f} fits {} target range (${}-${})", price, strategy.name, lo, hi));
        } else {
            score -= 30.0;
            result.reasoning.push_back(fmt::format(
                "Price ${:.2f} outside target range (${}-${})", price, lo, hi));
            result.confidence = std::max(0.0, score);
            return result;
        }
    }

    // 2. Options liquidity at the money
    const std::optional<double> atm_oi = snapshot.options.atm_call_oi ? snapshot.options.atm_call_oi
                                                                      : snapshot.options.atm_put_oi;
    if (filters.min_option_oi_per_strike && atm_oi) {
        if (*atm_oi >= *filters.min_option_oi_per_strike) {
            score += 20.0;
            result.reasoning.push_back(fmt::format("Options liquidity sufficient (OI: {:.0f})", *atm_oi));
        } else {
            score -= 20.0;
            result.reasoning.push_back(fmt::format("Low options liquidity (OI: {:.0f})", *atm_oi));
        }
    }

    // 3. Spread tolerance
    if (filters.max_option_spread && snapshot.options.avg_spread) {
        const double spread = *snapshot.options.avg_spread;
        if (spread <= *filters.max_option_spread) {
            score += 15.0;
            result.reasoning.push_back(fmt::format("Tight spreads ({:.1f}%)", spread * 100.0));
        } else {
            score -= 15.0;
            result.reasoning.push_back(fmt::format("Wide spreads ({:.1f}%)", spread * 100.0));
        }
    }

    // 4. Momentum alignment
    if (snapshot.technicals.rsi) {
        const double rsi = *snapshot.technicals.rsi;
        switch (momentumBias(tmpl.archetype)) {
            case MomentumBias::PUT_CENTRIC:
                if (rsi < config_.rsi_oversold) {
                    score += 15.0;
                    result.reasoning.push_back(fmt::format(
                        "RSI oversold ({:.1f}) - bullish setup for put selling", rsi));
                }
                break;
            case MomentumBias::CALL_CENTRIC:
                if (rsi > config_.rsi_overbought) {
                    score += 15.0;
                    result.reasoning.push_back(fmt::format(
                        "RSI overbought ({:.1f}) - bearish setup for call selling", rsi));
                }
                break;
            case MomentumBias::NONE:
                break;
        }
    }

    // 5. Earnings proximity
    if (snapshot.earnings_date && strategy.exits.time_exit_before_earnings_days) {
        const int days = daysBetween(snapshot.as_of, *snapshot.earnings_date);
        if (days > *strategy.exits.time_exit_before_earnings_days + config_.earnings_buffer_days) {
            score += 10.0;
            result.reasoning.push_back(fmt::format("Sufficient time before earnings ({} days)", days));
        } else {
            score -= 20.0;
            result.reasoning.push_back(fmt::format("Too close to earnings ({} days)", days));
        }
    }

    // 6. IV regime, premium sellers only
    if (snapshot.technicals.iv_percentile && sellsPremium(tmpl.archetype)) {
        const double ivp = *snapshot.technicals.iv_percentile;
        if (ivp > config_.iv_percentile_threshold) {
            score += 15.0;
            result.reasoning.push_back(fmt::format(
                "High IV environment ({:.0f}th percentile) - good for premium selling", ivp));
        } else {
            score -= 10.0;
            result.reasoning.push_back(fmt::format(
                "Low IV environment ({:.0f}th percentile) - less attractive for premium selling", ivp));
        }
    }

    result.confidence = std::max(0.0, std::min(100.0, score));
    return result;
}

double StrategyScorer::strikeIncrement(double current_price) const {
    return (current_price < config_.low_price_threshold) ? config_.low_price_strike_increment
                                                         : config_.strike_increment;
}

double StrategyScorer::atmStrike(double current_price) const {
    const double inc = strikeIncrement(current_price);
    return std::round(current_price / inc) * inc;
}

bool StrategyScorer::isTradable(const StrategySuggestion& suggestion) {
    if (!std::isfinite(suggestion.max_risk) || suggestion.max_risk < 0.0) {
        return false;
    }
    for (const auto& leg : suggestion.proposed_legs) {
        if (isOption(leg.type) && (!leg.strike || *leg.strike <= 0.0)) {
            return false;
        }
    }
    return true;
}

StrategySuggestion StrategyScorer::propose(
    const StrategyTemplate& tmpl,
    double current_price,
    const ScoreResult& score
) const {
    checkPrice(current_price);

    StrategySuggestion s;
    s.strategy_id = tmpl.strategy.strategy_id;
    s.strategy_name = tmpl.strategy.name;
    s.archetype = tmpl.archetype;
    s.confidence = score.confidence;
    s.reasoning = score.reasoning;

    const double atm = atmStrike(current_price);
    const double inc = strikeIncrement(current_price);
    const double credit = config_.assumed_credit * inc / config_.strike_increment;
    const double credit_dollars = credit * OPTION_MULTIPLIER;

    switch (tmpl.archetype) {
        case Archetype::PROTECTIVE_COLLAR: {
            spec::Leg stock;
            stock.type = LegType::STOCK;
            stock.side = LegSide::BUY;
            stock.qty = 100.0;
            s.proposed_legs = {
                stock,
                strikeLeg(LegType::PUT, LegSide::BUY, atm - inc, 35, -0.20),
                strikeLeg(LegType::CALL, LegSide::SELL, atm + inc, 14, 0.30),
            };
            s.max_risk = inc * OPTION_MULTIPLIER;   // down to the put strike
            s.max_profit = inc * OPTION_MULTIPLIER; // up to the call strike
            s.breakevens = {current_price};
            break;
        }
        case Archetype::PUT_CREDIT_SPREAD: {
            const double short_strike = atm - inc;
            const double long_strike = atm - 2.0 * inc;
            s.proposed_legs = {
                strikeLeg(LegType::PUT, LegSide::SELL, short_strike, 28, -0.25),
                strikeLeg(LegType::PUT, LegSide::BUY, long_strike, 28, -0.10),
            };
            s.max_risk = (short_strike - long_strike) * OPTION_MULTIPLIER - credit_dollars;
            s.max_profit = credit_dollars;
            s.breakevens = {short_strike - credit};
            break;
        }
        case Archetype::CASH_SECURED_PUT: {
            const double strike = atm - inc;
            s.proposed_legs = {
                strikeLeg(LegType::PUT, LegSide::SELL, strike, 28, -0.25),
            };
            s.max_risk = strike * OPTION_MULTIPLIER - credit_dollars;
            s.max_profit = credit_dollars;
            s.breakevens = {strike - credit};
            break;
        }
        case Archetype::IRON_CONDOR: {
            const double short_put = atm - 2.0 * inc;
            const double short_call = atm + 2.0 * inc;
            s.proposed_legs = {
                strikeLeg(LegType::PUT, LegSide::SELL, short_put, 30, -0.20),
                strikeLeg(LegType::PUT, LegSide::BUY, atm - 3.0 * inc, 30, -0.10),
                strikeLeg(LegType::CALL, LegSide::SELL, short_call, 30, 0.20),
                strikeLeg(LegType::CALL, LegSide::BUY, atm + 3.0 * inc, 30, 0.10),
            };
            s.max_risk = inc * OPTION_MULTIPLIER - credit_dollars;
            s.max_profit = credit_dollars;
            s.breakevens = {short_put - credit, short_call + credit};
            break;
        }
    }

    s.risk_reward_ratio = s.max_profit / std::max(s.max_risk, 1.0);
    return s;
}

SuggestionReport StrategyScorer::rank(
    const std::vector<StrategyTemplate>& catalog,
    const MarketSnapshot& snapshot
) const {
    checkPrice(snapshot.current_price);

    struct Scored {
        const StrategyTemplate* tmpl;
        ScoreResult score;
    };
    std::vector<Scored> scored;
    scored.reserve(catalog.size());
    for (const auto& t : catalog) {
        scored.push_back(Scored{&t, score(t, snapshot)});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        return a.score.confidence > b.score.confidence;
    });

    SuggestionReport report;
    report.symbol = snapshot.symbol;
    report.current_price = snapshot.current_price;
    report.analysis = analyze(snapshot);

    const size_t limit = static_cast<size_t>(std::max(0, config_.top_n));
    for (size_t i = 0; i < scored.size() && report.suggestions.size() < limit; ++i) {
        auto suggestion = propose(*scored[i].tmpl, snapshot.current_price, scored[i].score);
        if (!isTradable(suggestion)) {
            LOG_WARN("{} @ {:.2f}: skipping {}, strikes fall off the grid", snapshot.symbol,
                     snapshot.current_price, suggestion.strategy_id);
            continue;
        }
        Logger::getInstance().logProposal(snapshot.symbol, suggestion.strategy_id, suggestion.confidence,
                                          suggestion.max_risk, suggestion.max_profit);
        report.suggestions.push_back(std::move(suggestion));
    }

    LOG_INFO("{} @ {:.2f}: ranked {} template(s), returning {}", snapshot.symbol, snapshot.current_price,
             catalog.size(), report.suggestions.size());
    return report;
}

MarketAnalysis StrategyScorer::analyze(const MarketSnapshot& snapshot) {
    MarketAnalysis a;
    const auto& t = snapshot.technicals;

    if (t.rsi) {
        if (*t.rsi < 30.0) {
            a.technical_setup = "Oversold - Bullish reversal potential";
            a.risk_level = RiskLevel::LOW;
        } else if (*t.rsi > 70.0) {
            a.technical_setup = "Overbought - Bearish reversal potential";
            a.risk_level = RiskLevel::HIGH;
        } else if (t.sma20 && t.sma50) {
            a.technical_setup = (*t.sma20 > *t.sma50) ? "Uptrend - Bullish momentum"
                                                      : "Downtrend - Bearish momentum";
        }
    }

    if (t.iv_percentile) {
        if (*t.iv_percentile > 75.0) {
            a.iv_environment = "Elevated IV - Favorable for premium selling";
            a.risk_level = RiskLevel::HIGH;
        } else if (*t.iv_percentile < 25.0) {
            a.iv_environment = "Low IV - Favorable for premium buying";
            a.risk_level = RiskLevel::LOW;
        } else {
            a.iv_environment = fmt::format("Moderate IV ({:.0f}th percentile)", *t.iv_percentile);
        }
    }
    return a;
}

} // namespace scoring
} // namespace stratlab
