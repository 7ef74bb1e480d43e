#pragma once

#include "tracking/PositionTracker.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace stratlab {
namespace engine {

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    double quality_sum = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
    double avgExecutionQuality() const {
        return (trades > 0) ? (quality_sum / static_cast<double>(trades)) : 0.0;
    }
};

struct CaptureRecord {
    std::string position_id;
    std::string strategy_id;
    double score = 0.0;
};

struct PLSummary {
    int total_trades = 0;
    double avg_execution_quality = 0.0;
    double total_slippage = 0.0;
    double total_theoretical_pl = 0.0;  // sum of theoretical expected values
    double total_actual_pl = 0.0;       // sum of realized P&L
    double performance_gap = 0.0;       // actual - theoretical
    CaptureRecord best_capture;
    CaptureRecord worst_capture;
};

// Aggregates closed positions into strategy-level stats.
// Open positions are skipped.
class PerformanceStore {
public:
    explicit PerformanceStore(tracking::PositionTracker tracker = tracking::PositionTracker());

    void rebuild(const std::vector<tracking::PositionTracking>& positions);

    const std::unordered_map<std::string, StrategyPerformanceStats>& byStrategy() const {
        return by_strategy_;
    }
    const PLSummary& summary() const { return summary_; }

private:
    tracking::PositionTracker tracker_;
    std::unordered_map<std::string, StrategyPerformanceStats> by_strategy_;
    PLSummary summary_;
};

} // namespace engine
} // namespace stratlab
