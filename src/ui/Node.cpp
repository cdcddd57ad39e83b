#include "ui/Node.hpp"
#include <algorithm>

Node* Node::addChild(std::unique_ptr<Node> child) {
    if (!child) return nullptr;
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

std::unique_ptr<Node> Node::removeChild(Node* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [child](const std::unique_ptr<Node>& c) { return c.get() == child; });
    if (it == children_.end()) return nullptr;

    std::unique_ptr<Node> out = std::move(*it);
    children_.erase(it);
    out->parent_ = nullptr;
    childRemoved(*out);
    return out;
}

bool Node::isAncestorOf(const Node* other) const {
    for (const Node* p = other ? other->parent_ : nullptr; p; p = p->parent_) {
        if (p == this) return true;
    }
    return false;
}

bool Node::isEffectivelyVisible() const {
    for (const Node* n = this; n; n = n->parent_) {
        if (!n->visible) return false;
    }
    return true;
}

void Node::render(RenderContext&) {}

bool Node::handleInput(Engine&, const KeyEvent&) {
    return false;
}

void Node::onFocus(Engine&) {}

void Node::onBlur(Engine&) {}
