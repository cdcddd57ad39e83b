#pragma once
#include "ui/Node.hpp"
#include <unordered_map>

enum class Orientation {
    Vertical,
    Horizontal
};

// Lays visible children out one after another along one axis.
// Hidden children take no space. Each child keeps its own size on the
// main axis; its cross-axis size is clipped to the content area.
class StackPanel : public Node {
public:
    explicit StackPanel(Orientation orientation = Orientation::Vertical,
                        int spacing = 0, int padding = 0,
                        std::string name = "stack")
        : Node(std::move(name))
        , orientation_(orientation)
        , spacing_(spacing)
        , padding_(padding) {}

    void arrange() override;
    bool isPanel() const override { return true; }

    Orientation orientation() const { return orientation_; }
    int spacing() const { return spacing_; }
    int padding() const { return padding_; }

    void setSpacing(int s) { spacing_ = s; }
    void setPadding(int p) { padding_ = p; }

    // Main-axis extent needed to hold the visible children
    int contentExtent() const;

private:
    Orientation orientation_;
    int spacing_;
    int padding_;

    struct CrossSize {
        int natural  = 0;   // what the child asked for; 0 fills
        int assigned = 0;   // what the last arrange() gave it
    };
    std::unordered_map<const Node*, CrossSize> cross_;
};
