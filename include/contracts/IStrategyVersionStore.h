#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace stratlab {
namespace contracts {

// Append-only version history keyed by strategy_id, owned outside the core
class IStrategyVersionStore {
public:
    virtual ~IStrategyVersionStore() = default;

    // 0 when the id has never been stored
    virtual int getCurrentVersion(const std::string& strategy_id) const = 0;
    virtual std::optional<Timestamp> getCreatedAt(const std::string& strategy_id) const = 0;
};

} // namespace contracts
} // namespace stratlab
