#pragma once
#include <stdexcept>
#include <string>

// A single node failed to paint. The renderer skips it for this frame.
class ComponentRenderError : public std::runtime_error {
public:
    ComponentRenderError(const std::string& node, const std::string& what)
        : std::runtime_error("render failed for '" + node + "': " + what)
        , node_(node) {}

    const std::string& node() const { return node_; }

private:
    std::string node_;
};

// A screen's init hook failed. Propagates out of pushScreen(); the frame
// loop recovers by forcing a full redraw.
class InitializationError : public std::runtime_error {
public:
    InitializationError(const std::string& screen, const std::string& what)
        : std::runtime_error("init failed for screen '" + screen + "': " + what)
        , screen_(screen) {}

    const std::string& screen() const { return screen_; }

private:
    std::string screen_;
};

// Terminal backend could not be set up or written to
class TerminalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
