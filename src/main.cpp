#include "app/Engine.hpp"
#include "app/EngineConfig.hpp"
#include "app/Errors.hpp"
#include "demo/TaskActions.hpp"
#include "demo/TaskListScreen.hpp"
#include "term/PosixTerminal.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>

static Engine* g_engine = nullptr;

static void signalHandler(int) {
    if (g_engine) g_engine->stop();
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void applyLogLevel(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

int main(int argc, char* argv[]) {
    std::string configPath = "config/trellis.json";
    if (argc > 1) configPath = argv[1];

    // stdout belongs to the UI, so log to a file only
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "trellis.log", 1048576 * 5, 3);  // 5MB, 3 files
    auto logger = std::make_shared<spdlog::logger>("trellis", fileSink);
    spdlog::set_default_logger(logger);
    applyLogLevel(getEnv("TRELLIS_LOG_LEVEL", "info"));

    EngineConfig config;
    try {
        config = loadEngineConfig(configPath);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        std::fprintf(stderr, "trellis-demo: %s\n", e.what());
        return 1;
    }

    // Config may move the log file; env still wins for the level
    if (config.logFile != "trellis.log") {
        fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, 1048576 * 5, 3);
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("trellis", fileSink));
    }
    applyLogLevel(getEnv("TRELLIS_LOG_LEVEL", config.logLevel));
    spdlog::flush_on(spdlog::level::warn);

    spdlog::info("Trellis demo v0.1.0 starting");

    PosixTerminal terminal;
    Engine engine(terminal, config);
    g_engine = &engine;

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    registerTaskActions(engine.store());

    auto seeded = engine.store().dispatch("state/reset", initialTaskState());
    if (!seeded.success) {
        spdlog::error("Seeding state failed: {}", seeded.error);
        return 1;
    }

    for (const char* title : {"Try the arrow keys", "Press space to finish a task",
                              "Press a to add a task"}) {
        auto r = engine.store().dispatch("task/add", {{"title", title}});
        if (!r.success) spdlog::warn("Could not add sample task: {}", r.error);
    }

    try {
        engine.navigator().pushScreen(std::make_unique<TaskListScreen>());
    } catch (const InitializationError& e) {
        spdlog::critical("{}", e.what());
        std::fprintf(stderr, "trellis-demo: %s\n", e.what());
        return 1;
    }

    int rc = engine.run();
    g_engine = nullptr;

    if (rc != 0)
        std::fprintf(stderr, "trellis-demo: %s\n", engine.lastError().c_str());

    spdlog::info("Trellis demo exiting ({})", rc);
    spdlog::shutdown();
    return rc;
}
