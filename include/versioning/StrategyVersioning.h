#pragma once

#include <string>

#include "common/Types.h"
#include "contracts/IStrategyVersionStore.h"
#include "spec/StrategySpec.h"

namespace stratlab {
namespace versioning {

struct StrategyRevision {
    spec::Strategy strategy;        // version already assigned
    Timestamp created_at = Timestamp();
    Timestamp updated_at = Timestamp();
    bool is_new = true;
};

class StrategyVersioning {
public:
    // Assigns version = current + 1. New ids get created_at = now; existing
    // ids keep their original creation time. An empty id is generated.
    static StrategyRevision nextRevision(
        const contracts::IStrategyVersionStore& store,
        spec::Strategy strategy,
        Timestamp now
    );

    // strat_<epoch ms>_<9 base36 chars>
    static std::string generateStrategyId(Timestamp now);
};

} // namespace versioning
} // namespace stratlab
