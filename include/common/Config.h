#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace crosstrade {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults. Malformed JSON or an out-of-range field
    // throws InvalidConfigError before anything else runs.
    void load(const std::string& config_path);

    // Same as load() for an already parsed document
    void loadFromJson(const nlohmann::json& j);

    // Restore compiled-in defaults
    void reset();

    std::string getLogDirectory() const { return log_directory_; }
    std::string getLogLevel() const { return log_level_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setEngineConfig(const engine::EngineConfig& cfg) { engine_config_ = cfg; }

    // Validated copy; the engine receives this value, never the singleton
    strategy::StrategyConfig getStrategyConfig() const { return strategy_config_; }

private:
    Config() = default;

    std::string log_directory_ = "logs";
    std::string log_level_ = "info";

    engine::EngineConfig engine_config_;
    strategy::StrategyConfig strategy_config_;
};

} // namespace crosstrade
