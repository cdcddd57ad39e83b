#pragma once
#include "render/Cell.hpp"
#include <string>
#include <vector>

// Double-buffered cell grid.
// front: exactly what the terminal currently shows.
// back:  the frame being composed; becomes front only via commit().
class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int width, int height);

    // Resizes and blanks both buffers
    void resize(int width, int height);

    int width() const  { return width_; }
    int height() const { return height_; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    // ── Composition (back buffer) ───────────────────────────────────────

    void clear(Color bg, Color fg);

    // Replace one cell. Writing over either half of a wide glyph blanks
    // the other half. Out-of-bounds writes are ignored.
    void put(int x, int y, const Cell& cell);

    // Writes UTF-8 text starting at (x, y) and returns the next writable
    // column. maxWidth < 0 means "up to the right edge".
    int writeText(int x, int y, const std::string& text,
                  Color fg, Color bg, int maxWidth = -1);

    void fillRect(int x, int y, int w, int h, const Cell& cell);

    // Single-line box border
    void drawBox(int x, int y, int w, int h, Color fg, Color bg);

    const Cell& back(int x, int y) const  { return back_[index(x, y)]; }
    const Cell& front(int x, int y) const { return front_[index(x, y)]; }

    // Mark one cell of front as displayed
    void commitCell(int x, int y) { front_[index(x, y)] = back_[index(x, y)]; }

    // back -> front for the whole grid
    void commit() { front_ = back_; }

    // Row text of the back buffer (placeholders skipped); handy for tests
    std::string backRowText(int y) const;

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * width_ + x;
    }

    int width_  = 0;
    int height_ = 0;
    std::vector<Cell> front_;
    std::vector<Cell> back_;
};
