#pragma once
#include "widgets/Box.hpp"
#include "widgets/TextField.hpp"

// Modal "New task" form: a title field plus Add / Cancel.
// Enter in the field or the Add button dispatches task/add; Escape closes.
class AddTaskDialog : public Box {
public:
    AddTaskDialog(int screenWidth, int screenHeight);

    bool handleInput(Engine& engine, const KeyEvent& key) override;

    TextField& field() { return *field_; }

private:
    void submit(Engine& engine);

    TextField* field_ = nullptr;
};
