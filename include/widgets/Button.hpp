#pragma once
#include "ui/Node.hpp"
#include <functional>
#include <string>

// Focusable "[ caption ]". Enter or Space presses it.
class Button : public Node {
public:
    using PressHandler = std::function<void(Engine&)>;

    Button(std::string caption, PressHandler onPress, std::string name = "button");

    void setCaption(const std::string& caption);
    const std::string& caption() const { return caption_; }

    void setOnPress(PressHandler handler) { onPress_ = std::move(handler); }

    void render(RenderContext& ctx) override;
    bool handleInput(Engine& engine, const KeyEvent& key) override;

    int pressCount() const { return presses_; }

private:
    std::string  caption_;
    PressHandler onPress_;
    int presses_ = 0;
};
