#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace validation {

struct TradeRecord {
    std::string strategy_id;
    Timestamp timestamp;
    double pnl = 0.0;
};

// Account/market facts the caller supplies for rules that depend on them
struct AccountContext {
    TradingMode trading_mode = TradingMode::PAPER;
    std::vector<TradeRecord> trade_history;
    Timestamp as_of = Timestamp();
};

struct TradeHistorySummary {
    int trades = 0;
    int wins = 0;
    double days_active = 0.0; // as_of minus the earliest trade, in days

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
};

TradeHistorySummary summarizeHistory(
    const std::vector<TradeRecord>& history,
    const std::string& strategy_id,
    Timestamp as_of
);

} // namespace validation
} // namespace stratlab
