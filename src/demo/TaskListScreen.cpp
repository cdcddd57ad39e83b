#include "demo/TaskListScreen.hpp"
#include "app/Engine.hpp"
#include "demo/AboutScreen.hpp"
#include "demo/AddTaskDialog.hpp"
#include "ui/TreeWalk.hpp"
#include "widgets/Box.hpp"
#include "widgets/Button.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

// ── TaskRow ─────────────────────────────────────────────────────────────

TaskRow::TaskRow(int id, std::string title, bool done)
    : Node("task-" + std::to_string(id))
    , id_(id), title_(std::move(title)), done_(done) {
    focusable = true;
    height = 1;
}

void TaskRow::render(RenderContext& ctx) {
    const auto& t = ctx.theme;
    Color bg = isFocused() ? t.focus : t.background;
    Color fg = isFocused() ? t.background : (done_ ? t.muted : t.foreground);

    ctx.frame.fillRect(x, y, width, 1, Cell{" ", fg, bg, 1});
    std::string text = (done_ ? " [x] " : " [ ] ") + title_;
    ctx.frame.writeText(x, y, text, fg, bg, width);
}

bool TaskRow::handleInput(Engine& engine, const KeyEvent& key) {
    if (key.key == Key::Enter || key.is(' ')) {
        auto r = engine.store().dispatch("task/toggle", {{"id", id_}});
        if (!r.success) engine.notify(r.error, Notifications::Level::Error);
        return true;
    }
    if (key.is('d') || key.key == Key::Delete) {
        std::string title = title_;
        auto r = engine.store().dispatch("task/remove", {{"id", id_}});
        if (r.success)
            engine.notify("Removed \"" + title + "\"", Notifications::Level::Success);
        else
            engine.notify(r.error, Notifications::Level::Error);
        return true;
    }
    return false;
}

// ── TaskListScreen ──────────────────────────────────────────────────────

TaskListScreen::TaskListScreen() : Screen("tasks") {
    grid_ = &emplaceChild<GridPanel>(
        std::vector<Track>{Track::weighted(1)},
        std::vector<Track>{Track::weighted(1), Track::fixed(26)},
        "main-grid");

    auto& tasksBox = grid_->emplaceAt<Box>(0, 0, "Tasks", "tasks-box");
    list_ = &tasksBox.emplaceChild<StackPanel>(Orientation::Vertical, 0, 0, "task-list");

    auto& summaryBox = grid_->emplaceAt<Box>(0, 1, "Summary", "summary-box");
    auto& side = summaryBox.emplaceChild<StackPanel>(Orientation::Vertical, 1, 1, "summary");

    totalLabel_  = &side.emplaceChild<Label>("Total: 0", "total");
    doneLabel_   = &side.emplaceChild<Label>("Done:  0", "done");
    filterLabel_ = &side.emplaceChild<Label>("Showing all", "filter");

    side.emplaceChild<Button>("Add task",
        [this](Engine& e) { openAddDialog(e); }, "add-button");
    side.emplaceChild<Button>("Hide done",
        [](Engine& e) {
            auto r = e.store().dispatch("filter/toggle_done");
            if (!r.success) e.notify(r.error, Notifications::Level::Error);
        }, "filter-button");
}

TaskListScreen::~TaskListScreen() {
    if (!engine_) return;
    for (auto id : subscriptions_)
        engine_->store().unsubscribe(id);
}

void TaskListScreen::init(Engine& engine) {
    engine_ = &engine;
    auto& store = engine.store();

    // Each subscribe fires once right away, which builds the initial view
    subscriptions_.push_back(store.subscribe("tasks",
        [this](const json&, const json& tasks, const std::string&) {
            rebuildRows(tasks);
        }));

    subscriptions_.push_back(store.subscribe("filter.hide_done",
        [this](const json&, const json& hide, const std::string&) {
            hideDone_ = hide.is_boolean() && hide.get<bool>();
            filterLabel_->setText(hideDone_ ? "Hiding done" : "Showing all");
            applyFilter();
        }));

    subscriptions_.push_back(store.subscribe("stats.total",
        [this](const json&, const json& n, const std::string&) {
            totalLabel_->setText("Total: " + std::to_string(n.is_number() ? n.get<int>() : 0));
        }));

    subscriptions_.push_back(store.subscribe("stats.done",
        [this](const json&, const json& n, const std::string&) {
            doneLabel_->setText("Done:  " + std::to_string(n.is_number() ? n.get<int>() : 0));
        }));

    // Start on the first task, or the "Add task" button
    engine.focus().tabNavigate(false);
    spdlog::info("TaskListScreen: ready ({} tasks)", rows_.size());
}

void TaskListScreen::onResume(Engine& engine) {
    engine.requestRedraw(true);
}

void TaskListScreen::rebuildRows(const json& tasks) {
    auto& focus = engine_->focus();

    // Remember which row had focus so it survives the rebuild
    int focusedId = -1;
    int focusedIndex = -1;
    for (size_t i = 0; i < rows_.size(); i++) {
        if (rows_[i] == focus.current()) {
            focusedId = rows_[i]->id();
            focusedIndex = static_cast<int>(i);
        }
    }

    while (!list_->children().empty())
        engine_->discard(*list_, list_->children().back().get());
    rows_.clear();

    if (tasks.is_array()) {
        for (auto& t : tasks) {
            auto& row = list_->emplaceChild<TaskRow>(
                t.value("id", 0), t.value("title", std::string()), t.value("done", false));
            rows_.push_back(&row);
        }
    }

    if (rows_.empty()) {
        auto& hint = list_->emplaceChild<Label>(" No tasks yet. Press 'a' to add one.", "empty-hint");
        hint.setColor(engine_->theme().muted);
    }

    applyFilter();

    if (focusedIndex < 0) return;

    auto it = std::find_if(rows_.begin(), rows_.end(),
                           [focusedId](const TaskRow* r) { return r->id() == focusedId; });
    if (it != rows_.end() && focus.setFocus(*it)) return;

    // Row is gone or hidden; take its neighbour
    for (int i = std::min(focusedIndex, static_cast<int>(rows_.size()) - 1); i >= 0; i--) {
        if (focus.setFocus(rows_[i])) return;
    }
}

void TaskListScreen::applyFilter() {
    for (auto* row : rows_) {
        if (hideDone_ && row->done()) hide(*row);
        else show(*row);
    }
    if (engine_) {
        engine_->focus().validate();
        engine_->requestRedraw();
    }
}

void TaskListScreen::openAddDialog(Engine& engine) {
    engine.navigator().showDialog(std::make_unique<AddTaskDialog>(
        engine.frame().width(), engine.frame().height()));
}

void TaskListScreen::arrange() {
    grid_->setPosition(0, 1);
    grid_->setSize(width, std::max(0, height - 2));
}

void TaskListScreen::render(RenderContext& ctx) {
    const auto& t = ctx.theme;
    auto& frame = ctx.frame;
    if (height < 1) return;

    frame.fillRect(0, 0, width, 1, Cell{" ", t.background, t.accent, 1});
    frame.writeText(1, 0, "Trellis · Tasks", t.background, t.accent);

    if (height < 2) return;
    frame.writeText(1, height - 1,
                    "a add  space toggle  d delete  f filter  tab move  ? about  q quit",
                    t.muted, t.background);
}

bool TaskListScreen::handleInput(Engine& engine, const KeyEvent& key) {
    if (key.is('q') || (key.ctrl && key.text == "c")) {
        spdlog::info("TaskListScreen: quit requested");
        engine.stop();
        return true;
    }
    if (key.is('a')) {
        openAddDialog(engine);
        return true;
    }
    if (key.is('f')) {
        auto r = engine.store().dispatch("filter/toggle_done");
        if (!r.success) engine.notify(r.error, Notifications::Level::Error);
        return true;
    }
    if (key.is('?')) {
        engine.navigator().pushScreen(std::make_unique<AboutScreen>());
        return true;
    }
    if (key.key == Key::Down || key.is('j')) {
        engine.focus().tabNavigate(false);
        return true;
    }
    if (key.key == Key::Up || key.is('k')) {
        engine.focus().tabNavigate(true);
        return true;
    }
    return false;
}
