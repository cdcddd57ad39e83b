#include "widgets/Label.hpp"
#include "render/TextWidth.hpp"

Label::Label(std::string text, std::string name)
    : Node(std::move(name)), text_(std::move(text)) {
    height = 1;
    width = displayWidth(text_);
}

void Label::setText(const std::string& text) {
    text_ = text;
    if (autoSize_) width = displayWidth(text_);
}

void Label::setAutoSize(bool on) {
    autoSize_ = on;
    if (autoSize_) width = displayWidth(text_);
}

void Label::render(RenderContext& ctx) {
    if (width <= 0 || height <= 0) return;
    Color fg = fg_.value_or(ctx.theme.foreground);
    Color bg = bg_.value_or(ctx.theme.background);

    if (bg_) ctx.frame.fillRect(x, y, width, 1, Cell{" ", fg, bg, 1});
    ctx.frame.writeText(x, y, text_, fg, bg, width);
}
