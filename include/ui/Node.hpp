#pragma once
#include "input/KeyEvent.hpp"
#include "render/FrameBuffer.hpp"
#include "render/Theme.hpp"
#include <memory>
#include <string>
#include <vector>

class Engine;
class FocusManager;

// What a node paints with
struct RenderContext {
    FrameBuffer& frame;
    const Theme& theme;
};

struct Rect {
    int x = 0;
    int y = 0;
    int width  = 0;
    int height = 0;

    bool contains(int px, int py) const {
        return px >= x && py >= y && px < x + width && py < y + height;
    }
};

// Base of everything in the component tree: plain components, panels,
// screens and dialog roots. Children are exclusively owned; the parent
// pointer is a non-owning back reference.
class Node {
public:
    explicit Node(std::string name = "node") : name_(std::move(name)) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // ── Tree ────────────────────────────────────────────────────────────

    // Takes ownership and returns the raw pointer for convenience
    Node* addChild(std::unique_ptr<Node> child);

    template <typename T, typename... Args>
    T& emplaceChild(Args&&... args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *child;
        addChild(std::move(child));
        return ref;
    }

    // Detaches and returns the child, or nullptr if it isn't ours.
    // Use Engine::detach() when the subtree may hold focus.
    std::unique_ptr<Node> removeChild(Node* child);

    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
    Node* parent() const { return parent_; }

    bool isAncestorOf(const Node* other) const;

    // ── Geometry ────────────────────────────────────────────────────────

    int x = 0;
    int y = 0;
    int width  = 0;
    int height = 0;

    void setPosition(int px, int py) { x = px; y = py; }
    void setSize(int w, int h)       { width = w; height = h; }
    Rect bounds() const              { return {x, y, width, height}; }

    // ── Flags ───────────────────────────────────────────────────────────

    bool visible   = true;
    int  zIndex    = 0;
    bool focusable = false;

    // visible AND every ancestor visible
    bool isEffectivelyVisible() const;

    // Written only by FocusManager
    bool isFocused() const { return focused_; }

    const std::string& name() const { return name_; }
    void setName(const std::string& n) { name_ = n; }

    // ── Hooks ───────────────────────────────────────────────────────────

    // Panels position their children here; called before the children
    // are visited by the renderer.
    virtual void arrange() {}
    virtual bool isPanel() const { return false; }

    virtual void render(RenderContext& ctx);

    // Return true when the key was consumed
    virtual bool handleInput(Engine& engine, const KeyEvent& key);

    virtual void onFocus(Engine& engine);
    virtual void onBlur(Engine& engine);

protected:
    // Called by removeChild() after the child has left children()
    virtual void childRemoved(const Node& /*child*/) {}

private:
    friend class FocusManager;

    std::string name_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
    bool focused_ = false;
};
