#include "demo/TaskActions.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

int requireId(const json& payload) {
    if (!payload.is_object() || !payload.contains("id") ||
        !payload["id"].is_number_integer())
        throw std::invalid_argument("payload needs an integer 'id'");
    return payload["id"].get<int>();
}

// Index into tasks for id; throws when missing
size_t findTask(const json& tasks, int id) {
    for (size_t i = 0; i < tasks.size(); i++) {
        if (tasks[i].value("id", -1) == id) return i;
    }
    throw std::out_of_range("no task with id " + std::to_string(id));
}

} // namespace

json initialTaskState() {
    return {
        {"tasks",   json::array()},
        {"next_id", 1},
        {"filter",  {{"hide_done", false}}},
        {"stats",   {{"total", 0}, {"done", 0}}}
    };
}

void registerTaskActions(Store& store) {
    store.registerAction("state/reset", [](ActionContext& ctx, const json& payload) {
        if (!payload.is_object())
            throw std::invalid_argument("state/reset needs an object");
        ctx.updateState(payload);
    });

    store.registerAction("stats/recount", [](ActionContext& ctx, const json&) {
        auto tasks = ctx.getState("tasks");
        int total = 0, done = 0;
        if (tasks.is_array()) {
            for (auto& t : tasks) {
                total++;
                if (t.value("done", false)) done++;
            }
        }
        ctx.updateState({{"stats.total", total}, {"stats.done", done}});
    });

    store.registerAction("task/add", [](ActionContext& ctx, const json& payload) {
        std::string title;
        if (payload.is_object()) title = trim(payload.value("title", ""));
        if (title.empty())
            throw std::invalid_argument("task title must not be empty");

        auto tasks = ctx.getState("tasks");
        if (!tasks.is_array()) tasks = json::array();
        int id = ctx.getState("next_id").is_number_integer()
               ? ctx.getState("next_id").get<int>() : 1;

        tasks.push_back({{"id", id}, {"title", title}, {"done", false}});
        ctx.updateState({{"tasks", tasks}, {"next_id", id + 1}});
        ctx.dispatch("stats/recount");
    });

    store.registerAction("task/toggle", [](ActionContext& ctx, const json& payload) {
        int id = requireId(payload);
        auto tasks = ctx.getState("tasks");
        size_t i = findTask(tasks, id);
        tasks[i]["done"] = !tasks[i].value("done", false);
        ctx.updateState({{"tasks", tasks}});
        ctx.dispatch("stats/recount");
    });

    store.registerAction("task/remove", [](ActionContext& ctx, const json& payload) {
        int id = requireId(payload);
        auto tasks = ctx.getState("tasks");
        size_t i = findTask(tasks, id);
        tasks.erase(tasks.begin() + static_cast<long>(i));
        ctx.updateState({{"tasks", tasks}});
        ctx.dispatch("stats/recount");
    });

    store.registerAction("filter/toggle_done", [](ActionContext& ctx, const json&) {
        bool hide = ctx.getState("filter.hide_done").is_boolean()
                  && ctx.getState("filter.hide_done").get<bool>();
        ctx.updateState({{"filter.hide_done", !hide}});
    });

    spdlog::debug("Task actions registered");
}
