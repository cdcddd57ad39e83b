#pragma once
#include "ui/Node.hpp"
#include <optional>
#include <string>

// One line of text. Sizes itself to the text unless given a fixed width.
class Label : public Node {
public:
    explicit Label(std::string text = "", std::string name = "label");

    void setText(const std::string& text);
    const std::string& text() const { return text_; }

    // Unset colors follow the theme
    void setColor(Color fg) { fg_ = fg; }
    void setBackground(Color bg) { bg_ = bg; }

    // When off, width stays where layout or the caller put it
    void setAutoSize(bool on);

    void render(RenderContext& ctx) override;

private:
    std::string text_;
    std::optional<Color> fg_;
    std::optional<Color> bg_;
    bool autoSize_ = true;
};
