#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace stratlab {

using Timestamp = std::chrono::system_clock::time_point;

// Contract multiplier for equity options
constexpr double OPTION_MULTIPLIER = 100.0;

enum class LegType { STOCK, CALL, PUT };
enum class LegSide { BUY, SELL };
enum class TradingMode { LIVE, PAPER };

struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        theta += other.theta;
        vega += other.vega;
        return *this;
    }
};

struct PayoffPoint {
    double price = 0.0;
    double pnl = 0.0;
};

// +1 for long, -1 for short (payoff convention)
inline double sideSign(LegSide side) {
    switch (side) {
        case LegSide::BUY: return 1.0;
        case LegSide::SELL: return -1.0;
    }
    return 1.0;
}

// +1 for premium received, -1 for premium paid (credit convention)
inline double creditSign(LegSide side) {
    return -sideSign(side);
}

inline bool isOption(LegType type) {
    switch (type) {
        case LegType::CALL:
        case LegType::PUT:
            return true;
        case LegType::STOCK:
            return false;
    }
    return false;
}

std::string toString(LegType type);
std::string toString(LegSide side);
std::optional<LegType> legTypeFromString(const std::string& value);
std::optional<LegSide> legSideFromString(const std::string& value);

long long toEpochMs(Timestamp ts);
Timestamp fromEpochMs(long long ms);

} // namespace stratlab
