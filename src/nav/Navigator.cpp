#include "nav/Navigator.hpp"
#include "app/Engine.hpp"
#include "app/Errors.hpp"
#include "ui/TreeWalk.hpp"
#include <spdlog/spdlog.h>

Navigator::~Navigator() = default;

Node* Navigator::activeDialog() const {
    return dialogs_.empty() ? nullptr : dialogs_.back().root.get();
}

Node* Navigator::activeRoot() const {
    if (!dialogs_.empty()) return dialogs_.back().root.get();
    return current_.get();
}

// ── Screens ─────────────────────────────────────────────────────────────

void Navigator::pushScreen(std::unique_ptr<Screen> screen) {
    if (!screen) return;

    closeAllDialogs();

    auto& focus = engine_.focus();
    Node* saved = focus.current();
    focus.clear();

    if (current_) {
        current_->onExit(engine_);
        covered_.push_back({std::move(current_), saved});
    }

    current_ = std::move(screen);
    focus.setScope(current_.get());
    spdlog::info("Navigator: push '{}' (depth {})",
                 current_->name(), covered_.size());

    // Put the covered screen back if init fails
    auto rollback = [&]() {
        focus.releaseSubtree(*current_);
        retired_.push_back(std::move(current_));
        focus.setScope(nullptr);
        if (!covered_.empty()) {
            CoveredScreen top = std::move(covered_.back());
            covered_.pop_back();
            current_ = std::move(top.screen);
            focus.setScope(current_.get());
            current_->onResume(engine_);
            focusInto(current_.get(), top.savedFocus);
        }
        engine_.requestRedraw(true);
    };

    try {
        current_->init(engine_);
    } catch (const InitializationError& e) {
        spdlog::error("Navigator: {}", e.what());
        rollback();
        throw;
    } catch (const std::exception& e) {
        std::string name = current_->name();
        spdlog::error("Navigator: init of '{}' failed: {}", name, e.what());
        rollback();
        throw InitializationError(name, e.what());
    }

    engine_.requestRedraw();
}

bool Navigator::popScreen() {
    if (covered_.empty()) return false;

    closeAllDialogs();

    auto& focus = engine_.focus();
    focus.clear();
    current_->onExit(engine_);
    spdlog::info("Navigator: pop '{}'", current_->name());

    CoveredScreen top = std::move(covered_.back());
    covered_.pop_back();

    focus.setScope(nullptr);
    retired_.push_back(std::move(current_));
    current_ = std::move(top.screen);
    focus.setScope(current_.get());
    current_->onResume(engine_);
    focusInto(current_.get(), top.savedFocus);

    engine_.requestRedraw();
    return true;
}

// ── Dialogs ─────────────────────────────────────────────────────────────

void Navigator::showDialog(std::unique_ptr<Node> dialog) {
    if (!dialog) return;

    auto& focus = engine_.focus();
    Node* saved = focus.current();
    focus.clear();

    dialogs_.push_back({std::move(dialog), saved});
    spdlog::debug("Navigator: dialog '{}' opened (depth {})",
                  dialogs_.back().root->name(), dialogs_.size());

    focusInto(dialogs_.back().root.get(), nullptr);
    engine_.requestRedraw();
}

bool Navigator::closeDialog() {
    if (dialogs_.empty()) return false;

    auto& focus = engine_.focus();
    focus.clear();

    OpenDialog top = std::move(dialogs_.back());
    dialogs_.pop_back();
    spdlog::debug("Navigator: dialog '{}' closed", top.root->name());
    retired_.push_back(std::move(top.root));

    if (!dialogs_.empty())
        focusInto(dialogs_.back().root.get(), top.savedFocus);
    else
        focusInto(current_.get(), top.savedFocus);

    engine_.requestRedraw();
    return true;
}

void Navigator::closeAllDialogs() {
    while (closeDialog()) {}
}

void Navigator::flushRetired() {
    retired_.clear();
}

void Navigator::retire(std::unique_ptr<Node> tree) {
    if (tree) retired_.push_back(std::move(tree));
}

void Navigator::focusInto(Node* scope, Node* preferred) {
    auto& focus = engine_.focus();
    focus.setScope(scope);
    if (!scope) return;

    // The saved node may have been removed while it was covered
    if (preferred && containsNode(*scope, preferred) && focus.setFocus(preferred))
        return;

    // Dialogs always start with something focused
    if (scope != current_.get())
        focus.tabNavigate(false);
}
