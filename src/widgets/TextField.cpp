#include "widgets/TextField.hpp"

TextField::TextField(int columns, std::string placeholder, std::string name)
    : Node(std::move(name)), placeholder_(std::move(placeholder)) {
    focusable = true;
    width = columns;
    height = 1;
}

std::string TextField::value() const {
    std::string out;
    for (auto& g : glyphs_) out += g.text;
    return out;
}

void TextField::setValue(const std::string& text) {
    glyphs_ = splitGlyphs(text);
    if (maxLength_ > 0 && glyphs_.size() > maxLength_)
        glyphs_.resize(maxLength_);
    cursor_ = glyphs_.size();
}

void TextField::changed(Engine& engine) {
    if (onChange_) onChange_(engine, value());
}

bool TextField::handleInput(Engine& engine, const KeyEvent& key) {
    switch (key.key) {
        case Key::Character: {
            if (!key.isPrintable()) return false;
            if (maxLength_ > 0 && glyphs_.size() >= maxLength_) return true;
            auto typed = splitGlyphs(key.text);
            glyphs_.insert(glyphs_.begin() + cursor_, typed.begin(), typed.end());
            cursor_ += typed.size();
            changed(engine);
            return true;
        }
        case Key::Backspace:
            if (cursor_ == 0) return true;
            glyphs_.erase(glyphs_.begin() + (cursor_ - 1));
            cursor_--;
            changed(engine);
            return true;
        case Key::Delete:
            if (cursor_ >= glyphs_.size()) return true;
            glyphs_.erase(glyphs_.begin() + cursor_);
            changed(engine);
            return true;
        case Key::Left:
            if (cursor_ > 0) cursor_--;
            return true;
        case Key::Right:
            if (cursor_ < glyphs_.size()) cursor_++;
            return true;
        case Key::Home:
            cursor_ = 0;
            return true;
        case Key::End:
            cursor_ = glyphs_.size();
            return true;
        case Key::Enter:
            if (!onSubmit_) return false;
            onSubmit_(engine, value());
            return true;
        default:
            return false;
    }
}

void TextField::render(RenderContext& ctx) {
    if (width <= 0) return;
    const auto& t = ctx.theme;
    auto& frame = ctx.frame;

    Color fieldBg = isFocused() ? t.muted : Color::rgb(40, 40, 52);
    frame.fillRect(x, y, width, 1, Cell{" ", t.foreground, fieldBg, 1});

    if (glyphs_.empty() && !isFocused()) {
        frame.writeText(x, y, placeholder_, t.muted, fieldBg, width);
        return;
    }

    // Scroll so the cursor column stays inside the field
    int cursorCol = 0;
    for (size_t i = 0; i < cursor_; i++) cursorCol += glyphs_[i].width;

    size_t first = 0;
    int offset = 0;
    while (cursorCol - offset >= width && first < glyphs_.size()) {
        offset += glyphs_[first].width;
        first++;
    }

    int col = x;
    for (size_t i = first; i < glyphs_.size(); i++) {
        if (col + glyphs_[i].width > x + width) break;
        bool atCursor = isFocused() && i == cursor_;
        Color fg = atCursor ? fieldBg : t.foreground;
        Color bg = atCursor ? t.focus : fieldBg;
        col = frame.writeText(col, y, glyphs_[i].text, fg, bg, glyphs_[i].width);
    }

    // Cursor sits past the last glyph
    if (isFocused() && cursor_ == glyphs_.size() && col < x + width)
        frame.put(col, y, Cell{" ", fieldBg, t.focus, 1});
}
