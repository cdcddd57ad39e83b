#include "render/Renderer.hpp"
#include "app/Errors.hpp"
#include "nav/Screen.hpp"
#include "ui/TreeWalk.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// 0..255 -> 0..5 step of the xterm 6x6x6 cube
int toCube(uint8_t c) {
    return c / 51;
}

int cubeIndex(Color c) {
    return 16 + 36 * toCube(c.r) + 6 * toCube(c.g) + toCube(c.b);
}

} // namespace

Renderer::Renderer(ITerminal& term, FrameBuffer& frame, const Theme& theme,
                   bool truecolor)
    : term_(term), frame_(frame), theme_(&theme), truecolor_(truecolor) {}

void Renderer::invalidate() {
    needFull_ = true;
    lastFg_.reset();
    lastBg_.reset();
}

// ── Render queue ────────────────────────────────────────────────────────

std::vector<Node*> Renderer::buildRenderQueue(Screen* screen, Node* dialog,
                                              Node* overlay) const {
    std::vector<Node*> queue;

    auto visit = [&](Node& n) {
        n.arrange();
        queue.push_back(&n);
    };

    if (screen && screen->isEffectivelyVisible()) {
        // Screens always cover the whole frame
        screen->setPosition(0, 0);
        screen->setSize(frame_.width(), frame_.height());
        screen->arrange();
        for (auto& child : screen->children())
            walkEffectivelyVisible(*child, visit);
    }
    if (dialog)  walkEffectivelyVisible(*dialog, visit);
    if (overlay) walkEffectivelyVisible(*overlay, visit);

    std::stable_sort(queue.begin(), queue.end(),
        [](const Node* a, const Node* b) { return a->zIndex < b->zIndex; });
    return queue;
}

// ── Frame ───────────────────────────────────────────────────────────────

FrameStats Renderer::renderFrame(Screen* screen, Node* dialog, Node* overlay) {
    FrameStats stats;

    if (frame_.width() != lastW_ || frame_.height() != lastH_) {
        invalidate();
        lastW_ = frame_.width();
        lastH_ = frame_.height();
    }

    frame_.clear(theme_->background, theme_->foreground);
    RenderContext ctx{frame_, *theme_};

    if (screen && screen->isEffectivelyVisible()) {
        screen->setPosition(0, 0);
        screen->setSize(frame_.width(), frame_.height());
        try {
            screen->render(ctx);
        } catch (const std::exception& e) {
            stats.nodesFailed++;
            spdlog::warn("Renderer: {}", ComponentRenderError(screen->name(), e.what()).what());
        }
    }

    for (Node* node : buildRenderQueue(screen, dialog, overlay)) {
        try {
            node->render(ctx);
            stats.nodesPainted++;
        } catch (const ComponentRenderError& e) {
            stats.nodesFailed++;
            spdlog::warn("Renderer: {}", e.what());
        } catch (const std::exception& e) {
            stats.nodesFailed++;
            spdlog::warn("Renderer: {}", ComponentRenderError(node->name(), e.what()).what());
        }
    }

    stats.fullRepaint = needFull_;
    std::string out = diff(needFull_, stats.cellsChanged);

    if (!out.empty()) {
        try {
            term_.write(out);
            term_.flush();
        } catch (const TerminalError&) {
            // Terminal state unknown now; front stays as it was
            invalidate();
            throw;
        }
    }
    stats.bytesWritten = out.size();

    // Only now does the terminal show back
    frame_.commit();
    needFull_ = false;
    frames_++;

    if (stats.nodesFailed > 0 || stats.fullRepaint)
        spdlog::debug("Renderer: frame {} full={} cells={} bytes={} failed={}",
                      frames_, stats.fullRepaint, stats.cellsChanged,
                      stats.bytesWritten, stats.nodesFailed);
    return stats;
}

// ── Diff ────────────────────────────────────────────────────────────────

std::string Renderer::diff(bool full, int& changed) {
    std::string out;
    curX_ = -1;
    curY_ = -1;

    if (full) out += "\x1b[0m";

    const int w = frame_.width();
    for (int y = 0; y < frame_.height(); y++) {
        for (int x = 0; x < w; x++) {
            const Cell& cell = frame_.back(x, y);

            // Emitted with its lead
            if (cell.isPlaceholder()) continue;

            bool dirty = full || cell != frame_.front(x, y);
            if (!dirty && cell.isWide() && x + 1 < w)
                dirty = frame_.back(x + 1, y) != frame_.front(x + 1, y);
            if (!dirty) continue;

            if (curY_ != y || curX_ != x) moveCursor(out, x, y);
            setColors(out, cell.fg, cell.bg);
            out += cell.ch;

            curX_ = x + (cell.isWide() ? 2 : 1);
            changed++;
        }
    }
    return out;
}

void Renderer::moveCursor(std::string& out, int x, int y) {
    out += "\x1b[";
    out += std::to_string(y + 1);
    out += ';';
    out += std::to_string(x + 1);
    out += 'H';
    curX_ = x;
    curY_ = y;
}

void Renderer::setColors(std::string& out, Color fg, Color bg) {
    bool fgChanged = !lastFg_ || *lastFg_ != fg;
    bool bgChanged = !lastBg_ || *lastBg_ != bg;
    if (!fgChanged && !bgChanged) return;

    out += "\x1b[";
    if (fgChanged) appendColor(out, fg, false);
    if (fgChanged && bgChanged) out += ';';
    if (bgChanged) appendColor(out, bg, true);
    out += 'm';

    lastFg_ = fg;
    lastBg_ = bg;
}

void Renderer::appendColor(std::string& out, Color c, bool background) const {
    out += background ? "48;" : "38;";
    if (truecolor_) {
        out += "2;";
        out += std::to_string(c.r) + ';' + std::to_string(c.g) + ';' + std::to_string(c.b);
    } else {
        out += "5;";
        out += std::to_string(cubeIndex(c));
    }
}
