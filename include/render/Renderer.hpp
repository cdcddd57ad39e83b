#pragma once
#include "render/FrameBuffer.hpp"
#include "render/Theme.hpp"
#include "term/ITerminal.hpp"
#include <optional>
#include <string>
#include <vector>

class Node;
class Screen;

struct FrameStats {
    size_t bytesWritten = 0;
    int    cellsChanged = 0;
    int    nodesPainted = 0;
    int    nodesFailed  = 0;
    bool   fullRepaint  = false;
};

// Composes the active trees into the back buffer, diffs it against the
// front buffer and writes the minimal ANSI update to the terminal.
class Renderer {
public:
    Renderer(ITerminal& term, FrameBuffer& frame, const Theme& theme,
             bool truecolor = true);

    // One complete frame. dialog and overlay may be null.
    FrameStats renderFrame(Screen* screen, Node* dialog, Node* overlay = nullptr);

    // Screen children, then dialog tree, then overlay; invisible subtrees
    // skipped, panels arranged, then stable-sorted by zIndex.
    std::vector<Node*> buildRenderQueue(Screen* screen, Node* dialog,
                                        Node* overlay) const;

    // Next frame repaints every cell
    void invalidate();

    void setTheme(const Theme& theme) { theme_ = &theme; }
    void setTruecolor(bool on) { truecolor_ = on; invalidate(); }
    bool truecolor() const { return truecolor_; }

    int frameCount() const { return frames_; }

private:
    // back vs front -> escape string; appends changed cell count
    std::string diff(bool full, int& changed);

    void moveCursor(std::string& out, int x, int y);
    void setColors(std::string& out, Color fg, Color bg);
    void appendColor(std::string& out, Color c, bool background) const;

    ITerminal&   term_;
    FrameBuffer& frame_;
    const Theme* theme_;
    bool truecolor_;

    bool needFull_ = true;
    int  frames_   = 0;
    int  lastW_    = -1;
    int  lastH_    = -1;

    // Terminal cursor within the current frame; -1 means unknown
    int curX_ = -1;
    int curY_ = -1;

    // Last SGR colors sent to the terminal; valid across frames
    std::optional<Color> lastFg_;
    std::optional<Color> lastBg_;
};
