#include "common/Errors.h"
#include "lifecycle/OrderLifecycleStateMachine.h"
#include "lifecycle/Proposal.h"
#include "lifecycle/ProposalLifecycle.h"
#include "scoring/StrategyCatalog.h"
#include "scoring/StrategyScorer.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace stratlab;
using lifecycle::LegQuote;
using lifecycle::OrderLifecycleStateMachine;
using lifecycle::OrderStatus;
using lifecycle::ProposalBuilder;
using lifecycle::ProposalEvent;
using lifecycle::ProposalLifecycle;
using lifecycle::ProposalStatus;

namespace {
bool near(double a, double b, double tol = 1e-6) {
    return std::abs(a - b) <= tol;
}

template<typename Fn>
bool throwsViolation(Fn fn) {
    try {
        fn();
    } catch (const ContractViolation&) {
        return true;
    }
    return false;
}
} // namespace

int main() {
    const Timestamp created = fromEpochMs(1750000000000);
    const Timestamp deadline = created + std::chrono::minutes(25);

    // Put credit spread at 101: SELL PUT 95, BUY PUT 90
    const scoring::StrategyScorer scorer;
    const auto tmpl = scoring::StrategyCatalog::find(scoring::StrategyCatalog::seedTemplates(), "pc_spread_sub4_v1");
    assert(tmpl.has_value());
    scoring::ScoreResult score;
    score.confidence = 72.0;
    const auto suggestion = scorer.propose(*tmpl, 101.0, score);
    const std::vector<LegQuote> quotes = {{1.40, 1.50}, {0.50, 0.60}};

    const ProposalBuilder builder;
    const auto proposal = builder.build("prop-1", suggestion, 2, "XYZ", 101.0, quotes, created, deadline);

    // Pricing and risk from quotes
    {
        assert(proposal.status == ProposalStatus::PENDING);
        assert(proposal.strategy_id == "pc_spread_sub4_v1");
        assert(proposal.strategy_version == 2);
        assert(proposal.confidence == 72.0);
        assert(near(proposal.legs[0].entry_price, 1.45));
        assert(near(proposal.legs[1].entry_price, 0.55));

        assert(proposal.pricing.is_credit);
        assert(near(proposal.pricing.net_mid, 90.0));
        assert(near(proposal.pricing.net_bid, 80.0));
        assert(near(proposal.pricing.net_ask, 100.0));
        assert(near(proposal.pricing.spread, 20.0));
        assert(near(proposal.pricing.spread_pct, 20.0 / 90.0));

        assert(near(proposal.risk.max_profit, 90.0));
        assert(near(proposal.risk.max_risk, 410.0));
        assert(near(proposal.risk.capital_required, 410.0));
        assert(near(proposal.risk.risk_reward_ratio, 90.0 / 410.0));
        assert(proposal.risk.breakevens.size() == 1);
        assert(near(proposal.risk.breakevens[0], 94.1));

        auto j = lifecycle::toJson(proposal);
        assert(j["status"] == "pending");
        assert(j["pricing"]["type"] == "credit");
        assert(j["legs"][1]["ask"].get<double>() == 0.60);
    }

    // Debit positions reserve the premium paid
    {
        auto debit = ProposalBuilder::price(
            {analytics::PricedLeg{LegType::CALL, LegSide::BUY, 2.0, 100.0, "", 1.0}},
            {LegQuote{0.90, 1.10}});
        assert(!debit.is_credit);
        assert(near(debit.net_mid, -200.0));
        assert(near(debit.net_bid, -220.0));
        assert(near(debit.net_ask, -180.0));
    }

    // Builder rejects malformed input
    {
        assert(throwsViolation([&] {
            builder.build("p", suggestion, 1, "XYZ", 101.0, {{1.0, 1.1}}, created, deadline);
        }));
        assert(throwsViolation([&] {
            builder.build("p", suggestion, 1, "XYZ", 101.0, {{1.5, 1.4}, {0.5, 0.6}}, created, deadline);
        }));
        assert(throwsViolation([&] {
            builder.build("p", suggestion, 1, "XYZ", 101.0, quotes, deadline, created);
        }));
    }

    // Every ranked suggestion for a sub-$4 name can be built into a proposal
    {
        scoring::MarketSnapshot snapshot;
        snapshot.symbol = "SNDL";
        snapshot.current_price = 3.20;
        snapshot.as_of = created;
        snapshot.technicals.rsi = 35.0;
        snapshot.technicals.iv_percentile = 65.0;
        snapshot.options.atm_call_oi = 800.0;
        snapshot.options.avg_spread = 0.08;

        const auto report = scorer.rank(scoring::StrategyCatalog::seedTemplates(), snapshot);
        assert(report.suggestions.size() == 3);
        int n = 0;
        for (const auto& s : report.suggestions) {
            std::vector<LegQuote> leg_quotes;
            for (const auto& leg : s.proposed_legs) {
                assert(leg.type == LegType::STOCK || *leg.strike > 0.0);
                leg_quotes.push_back(leg.type == LegType::STOCK ? LegQuote{3.19, 3.21} : LegQuote{0.20, 0.30});
            }
            assert(s.max_risk >= 0.0);
            bool built = false;
            try {
                auto p = builder.build("sub4-" + std::to_string(n++), s, 1, "SNDL", 3.20, leg_quotes,
                                       created, deadline);
                built = p.risk.max_risk >= 0.0 && std::isfinite(p.risk.risk_reward_ratio);
            } catch (const ContractViolation&) {
                built = false;
            }
            assert(built);
        }
    }

    // Proposal approval flow
    {
        auto r = ProposalLifecycle::transition(ProposalStatus::PENDING, ProposalEvent::REJECT);
        assert(r.accepted && r.terminal);
        assert(r.status == ProposalStatus::REJECTED);

        r = ProposalLifecycle::transition(ProposalStatus::APPROVED, ProposalEvent::REJECT);
        assert(!r.accepted && r.terminal);
        assert(r.status == ProposalStatus::APPROVED);

        auto approved = ProposalLifecycle::apply(proposal, ProposalEvent::APPROVE, created + std::chrono::minutes(10));
        assert(approved.status == ProposalStatus::APPROVED);

        auto unchanged = ProposalLifecycle::apply(approved, ProposalEvent::REJECT, created + std::chrono::minutes(11));
        assert(unchanged.status == ProposalStatus::APPROVED);

        // Late approval expires the proposal
        const Timestamp late = deadline + std::chrono::seconds(1);
        assert(ProposalLifecycle::isExpired(proposal, late));
        assert(!ProposalLifecycle::isExpired(proposal, deadline));
        auto expired = ProposalLifecycle::apply(proposal, ProposalEvent::APPROVE, late);
        assert(expired.status == ProposalStatus::EXPIRED);
        assert(!ProposalLifecycle::isExpired(expired, late));
    }

    // Orders only come from approved proposals
    {
        assert(throwsViolation([&] { OrderLifecycleStateMachine::stage(proposal, "ord-0", 1.0, 3); }));

        auto approved = ProposalLifecycle::apply(proposal, ProposalEvent::APPROVE, created);
        assert(throwsViolation([&] { OrderLifecycleStateMachine::stage(approved, "ord-0", 0.0, 3); }));
        assert(throwsViolation([&] { OrderLifecycleStateMachine::stage(approved, "ord-0", 1.0, 0); }));
    }

    // Order lifecycle: staged -> submitted -> partial -> filled
    {
        auto approved = ProposalLifecycle::apply(proposal, ProposalEvent::APPROVE, created);
        auto order = OrderLifecycleStateMachine::stage(approved, "ord-1", 3.0, 2);
        assert(order.status == OrderStatus::STAGED);
        assert(order.proposal_id == "prop-1");
        assert(near(order.limit_price, 0.90));

        // No fills before submission; no reprice while staged
        auto same = OrderLifecycleStateMachine::apply(order, "fill", 3.0);
        assert(same.status == OrderStatus::STAGED);
        assert(same.filled_qty == 0.0);
        assert(throwsViolation([&] { OrderLifecycleStateMachine::reprice(order, 0.85); }));

        order = OrderLifecycleStateMachine::apply(order, "SUBMITTED");
        assert(order.status == OrderStatus::SUBMITTED);

        order = OrderLifecycleStateMachine::reprice(order, 0.85);
        order = OrderLifecycleStateMachine::reprice(order, 0.80);
        assert(order.attempts == 2);
        assert(near(order.limit_price, 0.80));
        assert(throwsViolation([&] { OrderLifecycleStateMachine::reprice(order, 0.75); }));

        order = OrderLifecycleStateMachine::apply(order, "partial", 1.0, 2.0);
        assert(order.status == OrderStatus::PARTIALLY_FILLED);
        assert(near(order.filled_qty, 1.0));
        assert(toString(order.status) == "partial");

        order = OrderLifecycleStateMachine::apply(order, "filled");
        assert(order.status == OrderStatus::FILLED);
        assert(near(order.filled_qty, 3.0));
        assert(OrderLifecycleStateMachine::isTerminal(order.status));

        auto after = OrderLifecycleStateMachine::apply(order, "cancel");
        assert(after.status == OrderStatus::FILLED);
    }

    // Raw transitions
    {
        auto r = OrderLifecycleStateMachine::transition("partial", OrderStatus::SUBMITTED, 0.0, 2.0, 0.0, 0.5);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(near(r.filled_qty, 1.5));
        assert(!r.terminal);

        r = OrderLifecycleStateMachine::transition("partial_fill", OrderStatus::SUBMITTED, 0.0, 2.0, 2.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);

        r = OrderLifecycleStateMachine::transition("Cancelled", OrderStatus::PARTIALLY_FILLED, 0.5, 2.0);
        assert(r.status == OrderStatus::CANCELED);
        assert(r.terminal);
        assert(r.filled_qty == 0.5);

        r = OrderLifecycleStateMachine::transition("rejected", OrderStatus::STAGED, 0.0, 1.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);

        r = OrderLifecycleStateMachine::transition("expired_by_magic", OrderStatus::SUBMITTED, 0.0, 1.0);
        assert(!r.accepted);
        assert(r.status == OrderStatus::SUBMITTED);
    }

    std::cout << "[TEST] OrderLifecycle PASSED\n";
    return 0;
}
