#pragma once
#include "render/TextWidth.hpp"
#include "ui/Node.hpp"
#include <functional>
#include <string>
#include <vector>

// Single-line text input. Editing works on glyphs, so wide characters and
// combining marks move and delete as one unit.
class TextField : public Node {
public:
    using ChangeHandler = std::function<void(Engine&, const std::string&)>;
    using SubmitHandler = std::function<void(Engine&, const std::string&)>;

    explicit TextField(int columns = 20, std::string placeholder = "",
                       std::string name = "textfield");

    std::string value() const;
    void setValue(const std::string& text);
    void clear() { setValue(""); }

    // Cursor position in glyphs
    size_t cursor() const { return cursor_; }

    // 0 = unlimited
    void setMaxLength(size_t glyphs) { maxLength_ = glyphs; }

    void setOnChange(ChangeHandler h) { onChange_ = std::move(h); }
    void setOnSubmit(SubmitHandler h) { onSubmit_ = std::move(h); }

    void render(RenderContext& ctx) override;
    bool handleInput(Engine& engine, const KeyEvent& key) override;

private:
    void changed(Engine& engine);

    std::vector<Glyph> glyphs_;
    size_t cursor_    = 0;
    size_t maxLength_ = 0;
    std::string placeholder_;

    ChangeHandler onChange_;
    SubmitHandler onSubmit_;
};
