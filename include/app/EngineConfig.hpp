#pragma once
#include "input/InputQueue.hpp"
#include "render/Theme.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct EngineConfig {
    int    frameIntervalMs    = 33;    // ~30 fps
    int    inputPollMs        = 50;    // poller wait per readInput()
    size_t inputQueueCapacity = 100;
    InputQueue::DropPolicy dropPolicy = InputQueue::DropPolicy::DropOldest;
    size_t historyLimit       = 100;   // store dispatch history
    bool   truecolor          = true;  // false = 256-color cube
    int    notificationMs     = 3000;
    std::string logLevel      = "info";
    std::string logFile       = "trellis.log";
    Theme  theme;

    // Missing keys keep their defaults. Throws ConfigError on bad values.
    static EngineConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// Reads a JSON config file. A missing file yields defaults (and a warning);
// an unreadable or malformed one throws ConfigError.
EngineConfig loadEngineConfig(const std::string& path);

// "drop_oldest" / "drop_newest"
InputQueue::DropPolicy parseDropPolicy(const std::string& name);
const char* dropPolicyName(InputQueue::DropPolicy policy);
