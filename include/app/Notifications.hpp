#pragma once
#include "ui/Node.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

// Transient messages ("toasts") shown on top of everything
class Notifications {
public:
    using Clock = std::chrono::steady_clock;

    enum class Level { Info, Success, Warning, Error };

    struct Entry {
        uint64_t          id = 0;
        std::string       text;
        Level             level = Level::Info;
        Clock::time_point expiresAt;
    };

    // maxVisible is at least 1
    explicit Notifications(int defaultMs = 3000, size_t maxVisible = 4)
        : defaultMs_(defaultMs), maxVisible_(std::max<size_t>(1, maxVisible)) {}

    size_t maxVisible() const { return maxVisible_; }

    // durationMs < 0 uses the configured default
    uint64_t push(const std::string& text, Level level = Level::Info,
                  int durationMs = -1, Clock::time_point now = Clock::now());

    bool dismiss(uint64_t id);
    void clear() { entries_.clear(); }

    // Drops expired entries; true if anything was removed
    bool expire(Clock::time_point now = Clock::now());

    const std::deque<Entry>& active() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    void setDefaultMs(int ms) { defaultMs_ = ms; }

private:
    std::deque<Entry> entries_;
    uint64_t nextId_ = 1;
    int      defaultMs_;
    size_t   maxVisible_;
};

const char* levelName(Notifications::Level level);

// Overlay node: stacks the active notifications in the bottom-right corner
class NotificationArea : public Node {
public:
    explicit NotificationArea(const Notifications& source);

    void render(RenderContext& ctx) override;

    static constexpr int kMaxWidth = 40;

private:
    const Notifications& source_;
};
