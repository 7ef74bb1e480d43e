#include "engine/PerformanceStore.h"

#include <cmath>

namespace stratlab {
namespace engine {
namespace {
void accumulateStats(StrategyPerformanceStats& s, double pnl, double quality) {
    s.trades++;
    s.net_profit += pnl;
    s.quality_sum += quality;
    if (pnl > 0.0) {
        s.wins++;
        s.gross_profit += pnl;
    } else if (pnl < 0.0) {
        s.gross_loss_abs += std::abs(pnl);
    }
}
}

PerformanceStore::PerformanceStore(tracking::PositionTracker tracker)
    : tracker_(tracker) {}

void PerformanceStore::rebuild(const std::vector<tracking::PositionTracking>& positions) {
    by_strategy_.clear();
    summary_ = PLSummary();

    double quality_sum = 0.0;
    for (const auto& position : positions) {
        if (!position.isClosed()) {
            continue;
        }

        const auto quality = tracker_.executionQuality(position);
        const double pnl = position.actual.realized_pl;
        const std::string strategy_id = position.strategy_id.empty() ? "unknown" : position.strategy_id;
        accumulateStats(by_strategy_[strategy_id], pnl, quality.score);

        CaptureRecord capture{position.position_id, strategy_id, quality.score};
        if (summary_.total_trades == 0 || quality.score > summary_.best_capture.score) {
            summary_.best_capture = capture;
        }
        if (summary_.total_trades == 0 || quality.score < summary_.worst_capture.score) {
            summary_.worst_capture = capture;
        }

        summary_.total_trades++;
        quality_sum += quality.score;
        summary_.total_slippage += quality.total_slippage;
        summary_.total_theoretical_pl += position.theoretical.expected_value;
        summary_.total_actual_pl += pnl;
    }

    if (summary_.total_trades > 0) {
        summary_.avg_execution_quality = quality_sum / static_cast<double>(summary_.total_trades);
    }
    summary_.performance_gap = summary_.total_actual_pl - summary_.total_theoretical_pl;
}

} // namespace engine
} // namespace stratlab
