#include "render/FrameBuffer.hpp"
#include "render/TextWidth.hpp"
#include <algorithm>

FrameBuffer::FrameBuffer(int width, int height) {
    resize(width, height);
}

void FrameBuffer::resize(int width, int height) {
    width_  = std::max(0, width);
    height_ = std::max(0, height);
    size_t n = static_cast<size_t>(width_) * height_;
    front_.assign(n, Cell{});
    back_.assign(n, Cell{});
}

void FrameBuffer::clear(Color bg, Color fg) {
    Cell blank;
    blank.fg = fg;
    blank.bg = bg;
    std::fill(back_.begin(), back_.end(), blank);
}

void FrameBuffer::put(int x, int y, const Cell& cell) {
    if (!inBounds(x, y)) return;

    Cell& dst = back_[index(x, y)];

    // Overwriting a wide lead orphans its placeholder
    if (dst.isWide() && x + 1 < width_) {
        Cell& tail = back_[index(x + 1, y)];
        if (tail.isPlaceholder())
            tail = Cell{" ", tail.fg, tail.bg, 1};
    }

    // Overwriting a placeholder orphans its lead
    if (dst.isPlaceholder() && !cell.isPlaceholder() && x > 0) {
        Cell& lead = back_[index(x - 1, y)];
        if (lead.isWide())
            lead = Cell{" ", lead.fg, lead.bg, 1};
    }

    dst = cell;
}

int FrameBuffer::writeText(int x, int y, const std::string& text,
                           Color fg, Color bg, int maxWidth) {
    if (y < 0 || y >= height_) return x;

    int limit = (maxWidth < 0) ? width_ : std::min(width_, x + maxWidth);

    for (auto& g : splitGlyphs(text)) {
        if (x + g.width > limit) break;

        if (x < 0) {
            // Clipped on the left edge
            x += g.width;
            continue;
        }

        if (g.width == 2) {
            put(x, y, Cell{g.text, fg, bg, 2});
            put(x + 1, y, Cell{" ", fg, bg, 0});
        } else {
            put(x, y, Cell{g.text, fg, bg, 1});
        }
        x += g.width;
    }
    return x;
}

void FrameBuffer::fillRect(int x, int y, int w, int h, const Cell& cell) {
    for (int row = y; row < y + h; row++)
        for (int col = x; col < x + w; col++)
            put(col, row, cell);
}

void FrameBuffer::drawBox(int x, int y, int w, int h, Color fg, Color bg) {
    if (w < 2 || h < 2) return;

    auto edge = [&](int cx, int cy, const char* s) {
        put(cx, cy, Cell{s, fg, bg, 1});
    };

    edge(x, y, "┌");
    edge(x + w - 1, y, "┐");
    edge(x, y + h - 1, "└");
    edge(x + w - 1, y + h - 1, "┘");
    for (int col = x + 1; col < x + w - 1; col++) {
        edge(col, y, "─");
        edge(col, y + h - 1, "─");
    }
    for (int row = y + 1; row < y + h - 1; row++) {
        edge(x, row, "│");
        edge(x + w - 1, row, "│");
    }
}

std::string FrameBuffer::backRowText(int y) const {
    std::string out;
    if (y < 0 || y >= height_) return out;
    for (int x = 0; x < width_; x++) {
        const Cell& c = back(x, y);
        if (!c.isPlaceholder()) out += c.ch;
    }
    return out;
}
