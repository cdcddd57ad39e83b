#include "widgets/Box.hpp"
#include <algorithm>

namespace {

bool containsFocus(const Node& node) {
    if (node.isFocused()) return true;
    for (auto& child : node.children())
        if (containsFocus(*child)) return true;
    return false;
}

} // namespace

Box::Box(std::string title, std::string name)
    : Node(std::move(name)), title_(std::move(title)) {}

void Box::arrange() {
    int innerW = std::max(0, width - 2);
    int innerH = std::max(0, height - 2);
    for (auto& child : children()) {
        child->setPosition(x + 1, y + 1);
        child->setSize(innerW, innerH);
    }
}

void Box::render(RenderContext& ctx) {
    const auto& t = ctx.theme;
    Color bg = fill_.value_or(t.background);

    if (fill_ && width > 2 && height > 2)
        ctx.frame.fillRect(x + 1, y + 1, width - 2, height - 2,
                           Cell{" ", t.foreground, bg, 1});

    // Border lights up while focus is somewhere inside
    Color border = containsFocus(*this) ? t.focus : t.muted;
    ctx.frame.drawBox(x, y, width, height, border, bg);

    if (!title_.empty() && width > 4)
        ctx.frame.writeText(x + 2, y, " " + title_ + " ", t.accent, bg, width - 4);
}
