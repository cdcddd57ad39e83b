#pragma once
#include "ui/Node.hpp"
#include <vector>

class Engine;

// Owns the single "focused node" reference (non-owning pointer) and the
// scope root tab order is computed in: the current screen, or the top
// dialog while one is open.
class FocusManager {
public:
    explicit FocusManager(Engine& engine) : engine_(engine) {}

    Node* current() const { return focused_; }
    Node* scope() const   { return scope_; }

    // Does not change focus
    void setScope(Node* root) { scope_ = root; }

    // nullptr clears focus. A candidate that is not effectively visible or
    // not focusable leaves focus unchanged. Returns true if node is now
    // the focused node (or focus was cleared on request).
    bool setFocus(Node* node);

    void clear() { setFocus(nullptr); }

    // Moves focus through the row-major tab order of the scope, wrapping
    // at either end. Recomputed from the tree on every call.
    Node* tabNavigate(bool reverse = false);

    // Effectively visible, focusable nodes of the scope in tab order
    std::vector<Node*> tabOrder() const;

    // Drops focus from a node that became hidden or unfocusable
    void validate();

    // Clears focus if it lives in node's subtree (call before destroying it)
    void releaseSubtree(const Node& node);

    // Drops both pointers without running hooks; for teardown only
    void forget() { focused_ = nullptr; scope_ = nullptr; }

private:
    Engine& engine_;
    Node* focused_ = nullptr;
    Node* scope_   = nullptr;
};
