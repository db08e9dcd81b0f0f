#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace papertrade {

class Config {
public:
    static Config& getInstance();

    // Missing file or missing keys keep the defaults
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const;
    std::string getLogLevel() const;
    std::string getDataDir() const;
    bool isLoaded() const;

private:
    Config() = default;

    void applyEnvironmentOverrides();

    mutable std::mutex mutex_;
    engine::EngineConfig engine_config_;
    bool loaded_ = false;
};

} // namespace papertrade
