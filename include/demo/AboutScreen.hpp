#pragma once
#include "nav/Screen.hpp"

// Static help page pushed over the task list. Escape or q goes back.
class AboutScreen : public Screen {
public:
    AboutScreen();

    void init(Engine& engine) override;
    void arrange() override;
    bool handleInput(Engine& engine, const KeyEvent& key) override;

private:
    Node* box_ = nullptr;
};
