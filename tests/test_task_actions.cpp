#include <gtest/gtest.h>
#include "demo/TaskActions.hpp"

using json = nlohmann::json;

class TaskActionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerTaskActions(store);
        ASSERT_TRUE(store.dispatch("state/reset", initialTaskState()).success);
    }

    int add(const std::string& title) {
        EXPECT_TRUE(store.dispatch("task/add", {{"title", title}}).success);
        return store.getState("next_id").get<int>() - 1;
    }

    Store store;
};

TEST_F(TaskActionsTest, InitialStateIsEmpty) {
    EXPECT_TRUE(store.getState("tasks").empty());
    EXPECT_EQ(store.getState("stats.total"), 0);
    EXPECT_EQ(store.getState("filter.hide_done"), false);
}

TEST_F(TaskActionsTest, AddAssignsIdsAndRecounts) {
    int a = add("buy milk");
    int b = add("  walk dog  ");
    EXPECT_EQ(b, a + 1);

    auto tasks = store.getState("tasks");
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[1]["title"], "walk dog");
    EXPECT_EQ(tasks[1]["done"], false);
    EXPECT_EQ(store.getState("stats.total"), 2);
}

TEST_F(TaskActionsTest, EmptyTitleIsRejected) {
    auto r = store.dispatch("task/add", {{"title", "   "}});
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("empty"), std::string::npos);
    EXPECT_TRUE(store.getState("tasks").empty());
}

TEST_F(TaskActionsTest, ToggleFlipsDoneAndUpdatesStats) {
    int id = add("a");
    add("b");

    ASSERT_TRUE(store.dispatch("task/toggle", {{"id", id}}).success);
    EXPECT_EQ(store.getState("tasks")[0]["done"], true);
    EXPECT_EQ(store.getState("stats.done"), 1);

    ASSERT_TRUE(store.dispatch("task/toggle", {{"id", id}}).success);
    EXPECT_EQ(store.getState("stats.done"), 0);
}

TEST_F(TaskActionsTest, RemoveDropsTask) {
    int a = add("a");
    add("b");
    ASSERT_TRUE(store.dispatch("task/remove", {{"id", a}}).success);

    auto tasks = store.getState("tasks");
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0]["title"], "b");
    EXPECT_EQ(store.getState("stats.total"), 1);
}

TEST_F(TaskActionsTest, UnknownOrMissingIdFails) {
    add("a");
    EXPECT_FALSE(store.dispatch("task/toggle", {{"id", 99}}).success);
    EXPECT_FALSE(store.dispatch("task/remove", json::object()).success);
    EXPECT_FALSE(store.dispatch("task/toggle", {{"id", "1"}}).success);
    EXPECT_EQ(store.getState("tasks").size(), 1u);
}

TEST_F(TaskActionsTest, FilterToggles) {
    store.dispatch("filter/toggle_done");
    EXPECT_EQ(store.getState("filter.hide_done"), true);
    store.dispatch("filter/toggle_done");
    EXPECT_EQ(store.getState("filter.hide_done"), false);
}

TEST_F(TaskActionsTest, SubscribersSeeStatsChange) {
    std::vector<int> totals;
    store.subscribe("stats.total", [&](const json&, const json& v, const std::string&) {
        totals.push_back(v.get<int>());
    });
    add("x");
    add("y");
    EXPECT_EQ(totals, (std::vector<int>{0, 1, 2}));
}
