#pragma once
#include "layout/GridPanel.hpp"
#include "layout/StackPanel.hpp"
#include "nav/Screen.hpp"
#include "state/Store.hpp"
#include "widgets/Label.hpp"
#include <vector>

// One task line: "[x] title". Enter/Space toggles, d/Delete removes.
class TaskRow : public Node {
public:
    TaskRow(int id, std::string title, bool done);

    int  id() const   { return id_; }
    bool done() const { return done_; }
    const std::string& title() const { return title_; }

    void render(RenderContext& ctx) override;
    bool handleInput(Engine& engine, const KeyEvent& key) override;

private:
    int  id_;
    std::string title_;
    bool done_;
};

// Main screen of the demo: task list on the left, summary on the right.
// Rows are rebuilt from the store whenever "tasks" changes.
class TaskListScreen : public Screen {
public:
    TaskListScreen();
    ~TaskListScreen() override;

    void init(Engine& engine) override;
    void onResume(Engine& engine) override;

    void arrange() override;
    void render(RenderContext& ctx) override;
    bool handleInput(Engine& engine, const KeyEvent& key) override;

    const std::vector<TaskRow*>& rows() const { return rows_; }
    StackPanel* list() const { return list_; }

private:
    void rebuildRows(const nlohmann::json& tasks);
    void applyFilter();
    void openAddDialog(Engine& engine);

    Engine* engine_ = nullptr;
    GridPanel*  grid_  = nullptr;
    StackPanel* list_  = nullptr;
    Label* totalLabel_  = nullptr;
    Label* doneLabel_   = nullptr;
    Label* filterLabel_ = nullptr;

    std::vector<TaskRow*> rows_;
    bool hideDone_ = false;
    std::vector<Store::SubscriptionId> subscriptions_;
};
