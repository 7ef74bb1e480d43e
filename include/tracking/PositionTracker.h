#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/PayoffEngine.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace stratlab {
namespace tracking {

struct PositionLeg {
    LegType type = LegType::STOCK;
    LegSide side = LegSide::BUY;
    double qty = 1.0;
    std::optional<double> strike;
    std::string expiration;
    double theoretical_price = 0.0; // baseline, never changes after open
    double actual_price = 0.0;      // fill
    double current_price = 0.0;     // latest mark
    std::optional<double> exit_price;
};

// Pre-trade baseline, immutable once the proposal was accepted
struct TheoreticalMetrics {
    double max_profit = 0.0;
    double max_loss = 0.0;
    std::vector<double> breakevens;
    double pop = 0.0;
    double expected_value = 0.0;
    double entry_price = 0.0;       // net credit (+) / debit (-) at theoretical prices
    Greeks greeks;
};

struct ActualMetrics {
    double entry_price = 0.0;       // net credit (+) / debit (-) at fill
    double entry_slippage = 0.0;    // sum(theoretical - actual) over legs
    std::optional<double> exit_slippage;
    double current_pl = 0.0;
    double unrealized_pl = 0.0;
    double realized_pl = 0.0;
    Greeks greeks;
    bool entry_recorded = false;
};

struct PositionTracking {
    std::string position_id;
    std::string symbol;
    std::string strategy_id;
    std::vector<PositionLeg> legs;
    TheoreticalMetrics theoretical;
    ActualMetrics actual;
    Timestamp proposed_at = Timestamp();
    Timestamp entered_at = Timestamp();
    Timestamp last_updated = Timestamp();
    std::optional<Timestamp> closed_at;

    bool isClosed() const { return closed_at.has_value(); }
};

struct ExecutionQuality {
    double score = 0.0;             // percent of theoretical expected value captured
    double entry_slippage_pct = 0.0;
    std::optional<double> exit_slippage_pct;
    double total_slippage = 0.0;    // dollars
};

struct GreeksComparison {
    Greeks theoretical;
    Greeks actual;
    Greeks variance;                // actual - theoretical
};

nlohmann::json toJson(const PositionTracking& tracking);
nlohmann::json toJson(const ExecutionQuality& quality);

// Realized-vs-theoretical bookkeeping for one filled position.
// Holds no lock: callers serialize calls per position id.
class PositionTracker {
public:
    explicit PositionTracker(engine::TrackerConfig config = engine::TrackerConfig());

    // Builds a tracking record whose theoretical block comes from the accepted payoff
    PositionTracking open(
        const std::string& position_id,
        const std::string& strategy_id,
        const std::vector<PositionLeg>& legs,
        const analytics::TheoreticalPayoff& payoff,
        Timestamp proposed_at,
        Timestamp entered_at
    ) const;

    // Marks the position to the legs' current prices. Idempotent for unchanged marks.
    PositionTracking update(const PositionTracking& tracking, Timestamp now) const;

    // Fill-time entry slippage, computed once
    PositionTracking recordFill(const PositionTracking& tracking) const;

    // exit_prices are per leg, in leg order
    PositionTracking close(
        const PositionTracking& tracking,
        const std::vector<double>& exit_prices,
        Timestamp closed_at
    ) const;

    ExecutionQuality executionQuality(const PositionTracking& tracking) const;
    GreeksComparison compareGreeks(const PositionTracking& tracking) const;

    Greeks currentGreeks(const std::vector<PositionLeg>& legs) const;

    // Net premium in dollars, credit positive
    static double netValue(const std::vector<PositionLeg>& legs, double PositionLeg::*price);

private:
    engine::TrackerConfig config_;
};

} // namespace tracking
} // namespace stratlab
