#include "validation/AccountContext.h"

#include <algorithm>

namespace stratlab {
namespace validation {

TradeHistorySummary summarizeHistory(
    const std::vector<TradeRecord>& history,
    const std::string& strategy_id,
    Timestamp as_of
) {
    TradeHistorySummary summary;
    bool has_first = false;
    Timestamp first_trade;

    for (const auto& trade : history) {
        if (trade.strategy_id != strategy_id) {
            continue;
        }
        summary.trades++;
        if (trade.pnl > 0.0) {
            summary.wins++;
        }
        if (!has_first || trade.timestamp < first_trade) {
            first_trade = trade.timestamp;
            has_first = true;
        }
    }

    if (has_first) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(as_of - first_trade).count();
        summary.days_active = std::max(0.0, static_cast<double>(elapsed) / 86400.0);
    }
    return summary;
}

} // namespace validation
} // namespace stratlab
