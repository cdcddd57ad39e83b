#pragma once
#include "ui/Node.hpp"
#include <optional>
#include <string>

// Bordered container with an optional title. Every child is stretched over
// the area inside the border, so a Box usually holds a single panel.
class Box : public Node {
public:
    explicit Box(std::string title = "", std::string name = "box");

    void setTitle(const std::string& title) { title_ = title; }
    const std::string& title() const { return title_; }

    // Background painted inside the border; unset leaves what is below
    void setFill(Color bg) { fill_ = bg; }

    void arrange() override;
    bool isPanel() const override { return true; }
    void render(RenderContext& ctx) override;

private:
    std::string title_;
    std::optional<Color> fill_;
};
