#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace auctionheat {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // Applies a parsed document on top of the current values
    void apply(const nlohmann::json& j);
    void reset() { engine_config_ = engine::EngineConfig(); log_level_ = "info"; log_dir_ = "logs"; }
    
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getDataDir() const { return engine_config_.data_dir; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    engine::EngineConfig engine_config_;
};

} // namespace auctionheat
