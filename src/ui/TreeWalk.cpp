#include "ui/TreeWalk.hpp"

namespace {

void walkVisible(Node& node, const std::function<void(Node&)>& visit) {
    if (!node.visible) return;
    visit(node);
    for (auto& child : node.children())
        walkVisible(*child, visit);
}

void setVisibleRecursive(Node& node, bool value) {
    node.visible = value;
    for (auto& child : node.children())
        setVisibleRecursive(*child, value);
}

} // namespace

void walkEffectivelyVisible(Node& root, const std::function<void(Node&)>& visit) {
    // Ancestors of root count too
    if (!root.isEffectivelyVisible()) return;
    walkVisible(root, visit);
}

std::vector<Node*> collectEffectivelyVisible(Node& root) {
    std::vector<Node*> out;
    walkEffectivelyVisible(root, [&](Node& n) { out.push_back(&n); });
    return out;
}

void hide(Node& node) {
    setVisibleRecursive(node, false);
}

void show(Node& node) {
    setVisibleRecursive(node, true);
}

bool containsNode(const Node& root, const Node* target) {
    if (&root == target) return true;
    for (auto& child : root.children()) {
        if (containsNode(*child, target)) return true;
    }
    return false;
}
