#include "app/Notifications.hpp"
#include "render/TextWidth.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

const char* levelName(Notifications::Level level) {
    switch (level) {
        case Notifications::Level::Info:    return "info";
        case Notifications::Level::Success: return "success";
        case Notifications::Level::Warning: return "warning";
        case Notifications::Level::Error:   return "error";
    }
    return "info";
}

uint64_t Notifications::push(const std::string& text, Level level,
                             int durationMs, Clock::time_point now) {
    int ms = durationMs < 0 ? defaultMs_ : durationMs;

    Entry e;
    e.id        = nextId_++;
    e.text      = text;
    e.level     = level;
    e.expiresAt = now + std::chrono::milliseconds(ms);
    entries_.push_back(std::move(e));

    // Oldest falls off once the stack is full
    while (entries_.size() > maxVisible_)
        entries_.pop_front();

    spdlog::debug("Notification [{}]: {}", levelName(level), text);
    return entries_.back().id;
}

bool Notifications::dismiss(uint64_t id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool Notifications::expire(Clock::time_point now) {
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                       [now](const Entry& e) { return e.expiresAt <= now; }),
                   entries_.end());
    return entries_.size() != before;
}

// ── Overlay ─────────────────────────────────────────────────────────────

NotificationArea::NotificationArea(const Notifications& source)
    : Node("notifications"), source_(source) {
    zIndex = 1000;
}

void NotificationArea::render(RenderContext& ctx) {
    auto& frame = ctx.frame;
    const auto& entries = source_.active();
    if (entries.empty()) return;

    int maxWidth = std::min(kMaxWidth, frame.width());
    int row = frame.height() - 1;

    // Newest at the bottom
    for (auto it = entries.rbegin(); it != entries.rend() && row >= 0; ++it, --row) {
        Color bg;
        switch (it->level) {
            case Notifications::Level::Info:    bg = ctx.theme.accent; break;
            case Notifications::Level::Success: bg = Color::rgb(80, 160, 90); break;
            case Notifications::Level::Warning: bg = ctx.theme.focus; break;
            case Notifications::Level::Error:   bg = Color::rgb(190, 60, 60); break;
        }
        Color fg = ctx.theme.background;

        std::string text = " " + truncateToWidth(it->text, std::max(0, maxWidth - 2)) + " ";
        int w = displayWidth(text);
        int x = frame.width() - w;
        frame.writeText(x, row, text, fg, bg, w);
    }
}
