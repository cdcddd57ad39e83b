#include "app/EngineConfig.hpp"
#include "app/Errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

InputQueue::DropPolicy parseDropPolicy(const std::string& name) {
    if (name == "drop_oldest") return InputQueue::DropPolicy::DropOldest;
    if (name == "drop_newest") return InputQueue::DropPolicy::DropNewest;
    throw ConfigError("unknown input_drop_policy: " + name);
}

const char* dropPolicyName(InputQueue::DropPolicy policy) {
    return policy == InputQueue::DropPolicy::DropNewest ? "drop_newest" : "drop_oldest";
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
        throw ConfigError("config root must be an object");

    EngineConfig c;
    try {
        c.frameIntervalMs    = j.value("frame_interval_ms", c.frameIntervalMs);
        c.inputPollMs        = j.value("input_poll_ms", c.inputPollMs);
        c.inputQueueCapacity = j.value("input_queue_capacity", c.inputQueueCapacity);
        c.historyLimit       = j.value("history_limit", c.historyLimit);
        c.truecolor          = j.value("truecolor", c.truecolor);
        c.notificationMs     = j.value("notification_ms", c.notificationMs);
        c.logLevel           = j.value("log_level", c.logLevel);
        c.logFile            = j.value("log_file", c.logFile);
        c.dropPolicy = parseDropPolicy(
            j.value("input_drop_policy", std::string(dropPolicyName(c.dropPolicy))));

        if (j.contains("theme"))
            c.theme = Theme::fromJson(j["theme"]);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("bad theme color: ") + e.what());
    }

    if (c.frameIntervalMs <= 0)
        throw ConfigError("frame_interval_ms must be positive");
    if (c.inputPollMs <= 0)
        throw ConfigError("input_poll_ms must be positive");
    if (c.inputQueueCapacity == 0)
        throw ConfigError("input_queue_capacity must be positive");
    if (c.notificationMs < 0)
        throw ConfigError("notification_ms must not be negative");
    return c;
}

nlohmann::json EngineConfig::toJson() const {
    return {
        {"frame_interval_ms",    frameIntervalMs},
        {"input_poll_ms",        inputPollMs},
        {"input_queue_capacity", inputQueueCapacity},
        {"input_drop_policy",    dropPolicyName(dropPolicy)},
        {"history_limit",        historyLimit},
        {"truecolor",            truecolor},
        {"notification_ms",      notificationMs},
        {"log_level",            logLevel},
        {"log_file",             logFile},
        {"theme",                theme.toJson()}
    };
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file not found: {} (using defaults)", path);
        return {};
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }

    spdlog::info("Loaded config: {}", path);
    return EngineConfig::fromJson(j);
}
