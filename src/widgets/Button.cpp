#include "widgets/Button.hpp"
#include "render/TextWidth.hpp"

Button::Button(std::string caption, PressHandler onPress, std::string name)
    : Node(std::move(name)), onPress_(std::move(onPress)) {
    focusable = true;
    height = 1;
    setCaption(caption);
}

void Button::setCaption(const std::string& caption) {
    caption_ = caption;
    width = displayWidth(caption_) + 4;
}

void Button::render(RenderContext& ctx) {
    const auto& t = ctx.theme;
    Color fg = isFocused() ? t.background : t.accent;
    Color bg = isFocused() ? t.focus : t.background;
    ctx.frame.writeText(x, y, "[ " + caption_ + " ]", fg, bg, width);
}

bool Button::handleInput(Engine& engine, const KeyEvent& key) {
    if (key.key != Key::Enter && !key.is(' ')) return false;
    presses_++;
    if (onPress_) onPress_(engine);
    return true;
}
