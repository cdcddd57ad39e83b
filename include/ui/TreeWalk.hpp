#pragma once
#include "ui/Node.hpp"
#include <functional>
#include <vector>

// Shared traversal used by the renderer and the focus manager, so the
// invisible-subtree rule is applied the same way everywhere.

// Pre-order walk over root and its descendants. A node whose effective
// visibility is false is skipped together with its whole subtree. The
// visitor runs before the node's children are read, so it may arrange them.
void walkEffectivelyVisible(Node& root, const std::function<void(Node&)>& visit);

// Same walk, collected into a list in visitation order
std::vector<Node*> collectEffectivelyVisible(Node& root);

// Sets visible=false on node and every descendant, unconditionally
void hide(Node& node);

// Sets visible=true on node and every descendant, unconditionally
void show(Node& node);

// True if target is root or one of its descendants. Only compares
// addresses, so target may be a pointer to a node that no longer exists.
bool containsNode(const Node& root, const Node* target);
