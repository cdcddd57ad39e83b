#include "demo/AboutScreen.hpp"
#include "app/Engine.hpp"
#include "layout/StackPanel.hpp"
#include "widgets/Box.hpp"
#include "widgets/Button.hpp"
#include "widgets/Label.hpp"
#include <algorithm>

AboutScreen::AboutScreen() : Screen("about") {
    auto& box = emplaceChild<Box>("About", "about-box");
    box_ = &box;

    auto& body = box.emplaceChild<StackPanel>(Orientation::Vertical, 0, 1, "about-body");
    for (const char* line : {
             "Trellis terminal UI runtime demo",
             "",
             "Tab / Shift-Tab   move focus",
             "Enter / Space     toggle a task or press a button",
             "a                 add a task",
             "d                 delete the focused task",
             "f                 hide or show finished tasks",
             "q                 quit",
         }) {
        body.emplaceChild<Label>(line);
    }
    body.emplaceChild<Label>("");
    body.emplaceChild<Button>("Back",
        [](Engine& e) { e.navigator().popScreen(); }, "back");
}

void AboutScreen::init(Engine& engine) {
    engine.focus().tabNavigate(false);
}

void AboutScreen::arrange() {
    int w = std::min(60, width);
    int h = std::min(16, height);
    box_->setPosition((width - w) / 2, (height - h) / 2);
    box_->setSize(w, h);
}

bool AboutScreen::handleInput(Engine& engine, const KeyEvent& key) {
    if (key.key == Key::Escape || key.is('q')) {
        engine.navigator().popScreen();
        return true;
    }
    return false;
}
