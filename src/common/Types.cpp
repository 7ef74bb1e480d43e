#include "common/Types.h"

namespace stratlab {

std::string toString(LegType type) {
    switch (type) {
        case LegType::STOCK: return "STOCK";
        case LegType::CALL: return "CALL";
        case LegType::PUT: return "PUT";
    }
    return "STOCK";
}

std::string toString(LegSide side) {
    switch (side) {
        case LegSide::BUY: return "BUY";
        case LegSide::SELL: return "SELL";
    }
    return "BUY";
}

std::optional<LegType> legTypeFromString(const std::string& value) {
    if (value == "STOCK") return LegType::STOCK;
    if (value == "CALL") return LegType::CALL;
    if (value == "PUT") return LegType::PUT;
    return std::nullopt;
}

std::optional<LegSide> legSideFromString(const std::string& value) {
    if (value == "BUY") return LegSide::BUY;
    if (value == "SELL") return LegSide::SELL;
    return std::nullopt;
}

long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp fromEpochMs(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

} // namespace stratlab
