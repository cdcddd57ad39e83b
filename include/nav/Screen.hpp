#pragma once
#include "ui/Node.hpp"

// A full-screen root. Its children are composed by the renderer; render()
// is reserved for chrome (title bars, backgrounds) drawn straight into the
// frame before the tree walk.
class Screen : public Node {
public:
    explicit Screen(std::string name = "screen") : Node(std::move(name)) {}

    // Called once when pushed. Throwing aborts the push.
    virtual void init(Engine& engine);

    // Covered by another screen or popped
    virtual void onExit(Engine& engine);

    // Uncovered after the screen above it was popped
    virtual void onResume(Engine& engine);
};
