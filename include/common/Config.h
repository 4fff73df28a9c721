#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace corolla {

// Loads config.json into plain config values. Created once in main and
// handed to each component's constructor by value.
class Config {
public:
    Config() = default;

    // Missing or unreadable file keeps defaults (reported on stdout).
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // COROLLA_MODE, COROLLA_LOG_LEVEL
    void applyEnvironmentOverrides();

    // empty when the values are usable
    std::vector<std::string> validate() const;

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::StrategyConfig getStrategyConfig() const { return strategy_config_; }
    std::string getLogLevel() const { return engine_config_.log_level; }

private:
    engine::EngineConfig engine_config_;
    strategy::StrategyConfig strategy_config_;
};

} // namespace corolla
