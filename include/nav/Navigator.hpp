#pragma once
#include "nav/Screen.hpp"
#include <memory>
#include <vector>

class Engine;

// Screen stack and modal dialog stack. Owns every screen and dialog tree;
// the renderer and focus manager only ever see the active roots.
class Navigator {
public:
    explicit Navigator(Engine& engine) : engine_(engine) {}
    ~Navigator();

    // Covers the current screen. Throws InitializationError (after
    // restoring the previous screen) if the new screen's init fails.
    void pushScreen(std::unique_ptr<Screen> screen);

    // Returns false when there is no screen underneath to go back to
    bool popScreen();

    // Opens a modal; focus moves into the dialog's subtree
    void showDialog(std::unique_ptr<Node> dialog);

    // Returns false when no dialog is open
    bool closeDialog();

    void closeAllDialogs();

    // Destroys popped screens and closed dialogs. A handler may close its
    // own dialog or pop its own screen, so trees are only destroyed once
    // the frame loop is done dispatching.
    void flushRetired();

    // Parks a detached subtree until the next flushRetired()
    void retire(std::unique_ptr<Node> tree);
    size_t retiredCount() const { return retired_.size(); }

    Screen* currentScreen() const { return current_.get(); }
    Node*   activeDialog() const;
    bool    hasDialog() const { return !dialogs_.empty(); }

    // Top dialog if any, else the current screen
    Node* activeRoot() const;

    // Screens underneath the current one
    size_t screenDepth() const { return covered_.size(); }
    size_t dialogDepth() const { return dialogs_.size(); }

private:
    struct CoveredScreen {
        std::unique_ptr<Screen> screen;
        Node* savedFocus = nullptr;
    };

    struct OpenDialog {
        std::unique_ptr<Node> root;
        Node* savedFocus = nullptr;   // focus displaced when it opened
    };

    void focusInto(Node* scope, Node* preferred);

    Engine& engine_;
    std::unique_ptr<Screen> current_;
    std::vector<CoveredScreen> covered_;
    std::vector<OpenDialog> dialogs_;
    std::vector<std::unique_ptr<Node>> retired_;
};
