#include <gtest/gtest.h>
#include "state/Store.hpp"
#include <stdexcept>

using json = nlohmann::json;

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.registerAction("INCR", [](ActionContext& ctx, const json&) {
            int n = ctx.getState("counter").get<int>();
            ctx.updateState({{"counter", n + 1}});
        });
    }

    Store store{json{{"counter", 0}, {"user", {{"name", "ada"}}}}};
};

TEST_F(StoreTest, UnknownActionFailsWithoutMutation) {
    auto before = store.getState();
    auto r = store.dispatch("NOPE");

    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("NOPE"), std::string::npos);
    EXPECT_EQ(store.getState(), before);
    EXPECT_TRUE(store.history().empty());
}

TEST_F(StoreTest, GetStateByPath) {
    EXPECT_EQ(store.getState("user.name"), "ada");
    EXPECT_TRUE(store.getState("user.email").is_null());
    EXPECT_TRUE(store.getState("counter.deeper").is_null());
    EXPECT_EQ(store.getState()["counter"], 0);
}

TEST_F(StoreTest, GetStateIndexesArrays) {
    Store s(json{{"items", {10, 20, 30}}});
    EXPECT_EQ(s.getState("items.1"), 20);
    EXPECT_TRUE(s.getState("items.7").is_null());
}

TEST_F(StoreTest, SubscribeCallsHandlerImmediately) {
    int calls = 0;
    json seenOld = "unset", seenNew;
    store.subscribe("counter", [&](const json& o, const json& n, const std::string& path) {
        calls++;
        seenOld = o;
        seenNew = n;
        EXPECT_EQ(path, "counter");
    });

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(seenOld.is_null());
    EXPECT_EQ(seenNew, 0);
}

TEST_F(StoreTest, DispatchNotifiesSubscriberAndRecordsHistory) {
    std::vector<std::pair<json, json>> changes;
    store.subscribe("counter", [&](const json& o, const json& n, const std::string&) {
        changes.push_back({o, n});
    });

    auto r = store.dispatch("INCR");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(store.getState("counter"), 1);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[1].first, 0);
    EXPECT_EQ(changes[1].second, 1);

    ASSERT_EQ(store.history().size(), 1u);
    const auto& h = store.history().back();
    EXPECT_EQ(h.action, "INCR");
    EXPECT_EQ(h.previous["counter"], 0);
    EXPECT_EQ(h.next["counter"], 1);
}

TEST_F(StoreTest, UnchangedValueDoesNotNotify) {
    int calls = 0;
    store.registerAction("SAME", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"counter", 0}});
    });
    store.subscribe("counter", [&](const json&, const json&, const std::string&) { calls++; });

    store.dispatch("SAME");
    EXPECT_EQ(calls, 1);   // only the initial call
}

TEST_F(StoreTest, SubscribersRunInRegistrationOrder) {
    std::vector<int> order;
    store.subscribe("counter", [&](const json& o, const json&, const std::string&) {
        if (!o.is_null()) order.push_back(1);
    });
    store.subscribe("counter", [&](const json& o, const json&, const std::string&) {
        if (!o.is_null()) order.push_back(2);
    });

    store.dispatch("INCR");
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(StoreTest, SubscriptionsAreExactPath) {
    int parentCalls = 0;
    store.subscribe("user", [&](const json&, const json&, const std::string&) { parentCalls++; });
    store.registerAction("RENAME", [](ActionContext& ctx, const json& p) {
        ctx.updateState({{"user.name", p}});
    });

    store.dispatch("RENAME", "grace");
    EXPECT_EQ(store.getState("user.name"), "grace");
    EXPECT_EQ(parentCalls, 1);
}

TEST_F(StoreTest, HistoryIsBounded) {
    for (int i = 0; i < 150; i++) store.dispatch("INCR");

    EXPECT_EQ(store.getState("counter"), 150);
    ASSERT_EQ(store.history().size(), 100u);
    EXPECT_EQ(store.history().front().previous["counter"], 50);
    EXPECT_EQ(store.history().back().next["counter"], 150);
}

TEST_F(StoreTest, ThrowingHandlerReportsFailure) {
    store.registerAction("BAD", [](ActionContext&, const json&) {
        throw std::runtime_error("broken handler");
    });

    auto r = store.dispatch("BAD");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "broken handler");
    EXPECT_TRUE(store.history().empty());
}

TEST_F(StoreTest, ThrowingSubscriberDoesNotStopOthers) {
    int reached = 0;
    store.subscribe("counter", [](const json& o, const json&, const std::string&) {
        if (!o.is_null()) throw std::runtime_error("subscriber failure");
    });
    store.subscribe("counter", [&](const json&, const json&, const std::string&) { reached++; });

    auto r = store.dispatch("INCR");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(reached, 2);
    EXPECT_EQ(store.getState("counter"), 1);
}

TEST_F(StoreTest, UnsubscribeIsIdempotent) {
    int calls = 0;
    auto id = store.subscribe("counter", [&](const json&, const json&, const std::string&) { calls++; });
    EXPECT_EQ(store.subscriberCount("counter"), 1u);

    store.unsubscribe(id);
    store.unsubscribe(id);
    store.unsubscribe(9999);
    EXPECT_EQ(store.subscriberCount("counter"), 0u);

    store.dispatch("INCR");
    EXPECT_EQ(calls, 1);
}

TEST_F(StoreTest, ReRegisteringOverwrites) {
    store.registerAction("INCR", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"counter", 100}});
    });
    store.dispatch("INCR");
    EXPECT_EQ(store.getState("counter"), 100);
    EXPECT_TRUE(store.hasAction("INCR"));
    EXPECT_FALSE(store.hasAction("DECR"));
}

TEST_F(StoreTest, NestedDispatchRunsImmediately) {
    std::vector<int> seenInside;
    store.registerAction("DOUBLE_INCR", [&](ActionContext& ctx, const json&) {
        ctx.dispatch("INCR");
        seenInside.push_back(ctx.getState("counter").get<int>());
        ctx.dispatch("INCR");
    });

    auto r = store.dispatch("DOUBLE_INCR");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(seenInside, (std::vector<int>{1}));
    EXPECT_EQ(store.getState("counter"), 2);

    // Two nested entries, then the outer one
    ASSERT_EQ(store.history().size(), 3u);
    EXPECT_EQ(store.history()[0].action, "INCR");
    EXPECT_EQ(store.history()[2].action, "DOUBLE_INCR");
    EXPECT_EQ(store.history()[2].previous["counter"], 0);
}

TEST_F(StoreTest, UpdateStateCreatesMissingObjects) {
    store.registerAction("DEEP", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"a.b.c", true}});
    });
    store.dispatch("DEEP");
    EXPECT_EQ(store.getState("a.b.c"), true);
}

TEST_F(StoreTest, NonObjectPartialIsHandlerError) {
    store.registerAction("WRONG", [](ActionContext& ctx, const json&) {
        ctx.updateState(json::array({1, 2}));
    });
    auto r = store.dispatch("WRONG");
    EXPECT_FALSE(r.success);
}

TEST(StoreArrayTest, IndexedPathUpdatesOneElement) {
    Store s(json{{"tasks", {{{"id", 1}, {"done", false}}, {{"id", 2}, {"done", false}}}}});
    s.registerAction("DONE_FIRST", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"tasks.0.done", true}});
    });

    int calls = 0;
    s.subscribe("tasks.0.done", [&](const json&, const json&, const std::string&) { calls++; });

    EXPECT_TRUE(s.dispatch("DONE_FIRST").success);
    ASSERT_TRUE(s.getState("tasks").is_array());
    ASSERT_EQ(s.getState("tasks").size(), 2u);
    EXPECT_EQ(s.getState("tasks.0.done"), true);
    EXPECT_EQ(s.getState("tasks.1.done"), false);
    EXPECT_EQ(s.getState("tasks.1.id"), 2);
    EXPECT_EQ(calls, 2);
}

TEST(StoreArrayTest, IndexOnePastEndAppends) {
    Store s(json{{"items", {10, 20}}});
    s.registerAction("PUSH", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"items.2", 30}});
    });
    EXPECT_TRUE(s.dispatch("PUSH").success);
    EXPECT_EQ(s.getState("items"), json({10, 20, 30}));
}

TEST(StoreArrayTest, OutOfRangeIndexFailsWithoutMutation) {
    Store s(json{{"tasks", {{{"id", 1}}, {{"id", 2}}}}});
    s.registerAction("BAD", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"tasks.5.done", true}});
    });
    auto before = s.getState();

    auto r = s.dispatch("BAD");
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("out of range"), std::string::npos);
    EXPECT_EQ(s.getState(), before);
    EXPECT_TRUE(s.history().empty());
}

TEST_F(StoreTest, PathThroughScalarFailsWithoutMutation) {
    store.registerAction("BAD", [](ActionContext& ctx, const json&) {
        ctx.updateState({{"counter.value", 1}});
    });
    auto r = store.dispatch("BAD");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(store.getState("counter"), 0);
}

TEST_F(StoreTest, NonStandardSubscriberThrowDoesNotStopOthers) {
    int reached = 0;
    store.subscribe("counter", [](const json& o, const json&, const std::string&) {
        if (!o.is_null()) throw 42;
    });
    store.subscribe("counter", [&](const json&, const json&, const std::string&) { reached++; });

    auto r = store.dispatch("INCR");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(store.getState("counter"), 1);
    EXPECT_EQ(reached, 2);
}

TEST_F(StoreTest, NonStandardThrowOnInitialCallIsContained) {
    Store::SubscriptionId id = 0;
    EXPECT_NO_THROW(id = store.subscribe("counter",
        [](const json&, const json&, const std::string&) { throw 42; }));
    EXPECT_EQ(store.subscriberCount("counter"), 1u);
    store.unsubscribe(id);
}

TEST(StoreLimitTest, CustomHistoryLimit) {
    Store s(json::object(), 3);
    s.registerAction("X", [](ActionContext&, const json&) {});
    for (int i = 0; i < 5; i++) s.dispatch("X");
    EXPECT_EQ(s.history().size(), 3u);
    EXPECT_EQ(s.historyLimit(), 3u);
}
