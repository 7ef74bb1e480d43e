#include "versioning/StrategyVersioning.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <random>

namespace stratlab {
namespace versioning {

StrategyRevision StrategyVersioning::nextRevision(
    const contracts::IStrategyVersionStore& store,
    spec::Strategy strategy,
    Timestamp now
) {
    if (strategy.strategy_id.empty()) {
        strategy.strategy_id = generateStrategyId(now);
    }

    const int current = store.getCurrentVersion(strategy.strategy_id);
    if (current < 0) {
        LOG_ERROR("Version store returned {} for {}", current, strategy.strategy_id);
        throw ContractViolation("negative version for " + strategy.strategy_id);
    }

    StrategyRevision revision;
    revision.is_new = (current == 0);
    revision.updated_at = now;
    revision.created_at = now;
    if (!revision.is_new) {
        if (auto created = store.getCreatedAt(strategy.strategy_id)) {
            revision.created_at = *created;
        }
    }

    strategy.version = current + 1;
    revision.strategy = std::move(strategy);

    LOG_INFO("Strategy {} -> version {}", revision.strategy.strategy_id, revision.strategy.version);
    return revision;
}

std::string StrategyVersioning::generateStrategyId(Timestamp now) {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);

    std::string suffix;
    for (int i = 0; i < 9; ++i) {
        suffix += kAlphabet[pick(rng)];
    }
    return "strat_" + std::to_string(toEpochMs(now)) + "_" + suffix;
}

} // namespace versioning
} // namespace stratlab
