#include "focus/FocusManager.hpp"
#include "ui/TreeWalk.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

bool FocusManager::setFocus(Node* node) {
    if (node == focused_) return true;

    if (node && (!node->focusable || !node->isEffectivelyVisible())) {
        spdlog::debug("Focus: '{}' is not focusable right now", node->name());
        return false;
    }

    if (Node* prev = focused_) {
        prev->focused_ = false;
        focused_ = nullptr;
        prev->onBlur(engine_);
    }

    if (!node) return true;

    focused_ = node;
    node->focused_ = true;
    node->onFocus(engine_);
    return true;
}

std::vector<Node*> FocusManager::tabOrder() const {
    std::vector<Node*> order;
    if (!scope_) return order;

    walkEffectivelyVisible(*scope_, [&](Node& n) {
        if (n.focusable) order.push_back(&n);
    });

    // Row-major; ties keep tree order
    std::stable_sort(order.begin(), order.end(), [](const Node* a, const Node* b) {
        if (a->y != b->y) return a->y < b->y;
        return a->x < b->x;
    });
    return order;
}

Node* FocusManager::tabNavigate(bool reverse) {
    auto order = tabOrder();
    if (order.empty()) return focused_;

    auto it = std::find(order.begin(), order.end(), focused_);
    Node* next = nullptr;
    if (it == order.end()) {
        next = reverse ? order.back() : order.front();
    } else {
        int n   = static_cast<int>(order.size());
        int idx = static_cast<int>(it - order.begin());
        idx = (idx + (reverse ? -1 : 1) + n) % n;
        next = order[idx];
    }

    setFocus(next);
    return focused_;
}

void FocusManager::validate() {
    if (!focused_) return;
    if (!focused_->focusable || !focused_->isEffectivelyVisible()) {
        spdlog::debug("Focus: dropping '{}' (hidden or unfocusable)",
                      focused_->name());
        setFocus(nullptr);
    }
}

void FocusManager::releaseSubtree(const Node& node) {
    if (!focused_) return;
    if (focused_ == &node || node.isAncestorOf(focused_))
        setFocus(nullptr);
}
