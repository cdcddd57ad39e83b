#include "demo/AddTaskDialog.hpp"
#include "app/Engine.hpp"
#include "layout/StackPanel.hpp"
#include "widgets/Button.hpp"
#include "widgets/Label.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

AddTaskDialog::AddTaskDialog(int screenWidth, int screenHeight)
    : Box("New task", "add-task-dialog") {
    zIndex = 100;
    setFill(Color::rgb(34, 34, 46));

    width  = std::min(50, std::max(20, screenWidth - 4));
    height = 9;
    x = std::max(0, (screenWidth - width) / 2);
    y = std::max(0, (screenHeight - height) / 2);

    auto& form = emplaceChild<StackPanel>(Orientation::Vertical, 1, 1, "form");
    auto& prompt = form.emplaceChild<Label>("Title:", "prompt");
    prompt.setBackground(Color::rgb(34, 34, 46));

    field_ = &form.emplaceChild<TextField>(0, "what needs doing?", "title");
    field_->setMaxLength(120);
    field_->setOnSubmit([this](Engine& e, const std::string&) { submit(e); });

    auto& buttons = form.emplaceChild<StackPanel>(Orientation::Horizontal, 2, 0, "buttons");
    buttons.height = 1;
    buttons.emplaceChild<Button>("Add", [this](Engine& e) { submit(e); }, "add");
    buttons.emplaceChild<Button>("Cancel",
        [](Engine& e) { e.navigator().closeDialog(); }, "cancel");
}

bool AddTaskDialog::handleInput(Engine& engine, const KeyEvent& key) {
    if (key.key == Key::Escape) {
        engine.navigator().closeDialog();
        return true;
    }
    return false;
}

void AddTaskDialog::submit(Engine& engine) {
    std::string title = field_->value();
    auto r = engine.store().dispatch("task/add", {{"title", title}});
    if (!r.success) {
        spdlog::warn("AddTaskDialog: {}", r.error);
        engine.notify(r.error, Notifications::Level::Warning);
        return;
    }
    engine.notify("Added \"" + title + "\"", Notifications::Level::Success);
    engine.navigator().closeDialog();
}
