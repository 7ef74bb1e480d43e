#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace stratlab {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // Apply an already parsed document (also used by load)
    void apply(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::PayoffConfig getPayoffConfig() const { return engine_config_.payoff; }
    engine::TrackerConfig getTrackerConfig() const { return engine_config_.tracker; }
    engine::ValidatorConfig getValidatorConfig() const { return engine_config_.validator; }
    engine::ScorerConfig getScorerConfig() const { return engine_config_.scorer; }

    // Restore compiled-in defaults
    void reset();

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    engine::EngineConfig engine_config_;
};

} // namespace stratlab
