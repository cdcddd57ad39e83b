#include <gtest/gtest.h>
#include "app/Engine.hpp"
#include "app/Errors.hpp"
#include "term/StringTerminal.hpp"
#include <stdexcept>

namespace {

class Focusable : public Node {
public:
    Focusable(const std::string& name, int row) : Node(name) {
        focusable = true;
        setPosition(0, row);
        setSize(4, 1);
    }
};

// Records lifecycle calls; optionally fails in init
class TestScreen : public Screen {
public:
    explicit TestScreen(const std::string& name, bool failInit = false)
        : Screen(name), failInit_(failInit) {
        first  = &emplaceChild<Focusable>(name + ".first", 0);
        second = &emplaceChild<Focusable>(name + ".second", 1);
    }

    void init(Engine& engine) override {
        inits++;
        if (failInit_) throw std::runtime_error("cannot load data");
        engine.focus().setFocus(first);
    }
    void onExit(Engine&) override   { exits++; }
    void onResume(Engine&) override { resumes++; }

    Focusable* first;
    Focusable* second;
    int inits = 0, exits = 0, resumes = 0;

private:
    bool failInit_;
};

class Dialog : public Node {
public:
    explicit Dialog(bool* destroyed = nullptr) : Node("dialog"), destroyed_(destroyed) {
        ok = &emplaceChild<Focusable>("ok", 10);
        cancel = &emplaceChild<Focusable>("cancel", 11);
    }
    ~Dialog() override {
        if (destroyed_) *destroyed_ = true;
    }

    Focusable* ok;
    Focusable* cancel;

private:
    bool* destroyed_;
};

// Removes a node from the covered screen, then fails
class DiscardingScreen : public Screen {
public:
    DiscardingScreen(Node& owner, Node* victim)
        : Screen("discarding"), owner_(owner), victim_(victim) {}

    void init(Engine& engine) override {
        engine.discard(owner_, victim_);
        throw std::runtime_error("cannot load data");
    }

private:
    Node& owner_;
    Node* victim_;
};

} // namespace

class NavigatorTest : public ::testing::Test {
protected:
    TestScreen* push(const std::string& name, bool failInit = false) {
        auto s = std::make_unique<TestScreen>(name, failInit);
        TestScreen* raw = s.get();
        nav().pushScreen(std::move(s));
        return raw;
    }

    Navigator& nav() { return engine.navigator(); }
    FocusManager& focus() { return engine.focus(); }

    StringTerminal term;
    Engine engine{term};
};

TEST_F(NavigatorTest, PushInitsAndScopesFocus) {
    auto* home = push("home");
    EXPECT_EQ(nav().currentScreen(), home);
    EXPECT_EQ(home->inits, 1);
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(focus().current(), home->first);
    EXPECT_EQ(nav().screenDepth(), 0u);
}

TEST_F(NavigatorTest, PopRestoresCoveredScreenAndFocus) {
    auto* home = push("home");
    focus().setFocus(home->second);

    auto* detail = push("detail");
    EXPECT_EQ(home->exits, 1);
    EXPECT_EQ(nav().screenDepth(), 1u);
    EXPECT_EQ(focus().current(), detail->first);

    EXPECT_TRUE(nav().popScreen());
    EXPECT_EQ(nav().currentScreen(), home);
    EXPECT_EQ(home->resumes, 1);
    EXPECT_EQ(focus().current(), home->second);
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(nav().retiredCount(), 1u);

    nav().flushRetired();
    EXPECT_EQ(nav().retiredCount(), 0u);
}

TEST_F(NavigatorTest, PopAtBottomIsRefused) {
    push("only");
    EXPECT_FALSE(nav().popScreen());
    EXPECT_NE(nav().currentScreen(), nullptr);
}

TEST_F(NavigatorTest, FailedInitRollsBack) {
    auto* home = push("home");
    focus().setFocus(home->second);

    try {
        push("broken", true);
        FAIL() << "expected InitializationError";
    } catch (const InitializationError& e) {
        EXPECT_EQ(e.screen(), "broken");
        EXPECT_NE(std::string(e.what()).find("cannot load data"), std::string::npos);
    }

    EXPECT_EQ(nav().currentScreen(), home);
    EXPECT_EQ(nav().screenDepth(), 0u);
    EXPECT_EQ(home->resumes, 1);
    EXPECT_EQ(focus().current(), home->second);
    EXPECT_TRUE(engine.needsRedraw());
}

TEST_F(NavigatorTest, FailedFirstScreenLeavesNothing) {
    EXPECT_THROW(push("broken", true), InitializationError);
    EXPECT_EQ(nav().currentScreen(), nullptr);
    EXPECT_EQ(focus().scope(), nullptr);
}

TEST_F(NavigatorTest, DialogTakesAndReturnsFocus) {
    auto* home = push("home");
    focus().setFocus(home->second);

    auto dialog = std::make_unique<Dialog>();
    Dialog* raw = dialog.get();
    nav().showDialog(std::move(dialog));

    EXPECT_TRUE(nav().hasDialog());
    EXPECT_EQ(nav().activeRoot(), raw);
    EXPECT_EQ(focus().scope(), raw);
    EXPECT_EQ(focus().current(), raw->ok);

    // Tab order is confined to the dialog
    focus().tabNavigate();
    EXPECT_EQ(focus().current(), raw->cancel);
    focus().tabNavigate();
    EXPECT_EQ(focus().current(), raw->ok);

    EXPECT_TRUE(nav().closeDialog());
    EXPECT_FALSE(nav().hasDialog());
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(focus().current(), home->second);
}

TEST_F(NavigatorTest, StackedDialogsUnwindInOrder) {
    push("home");
    auto first = std::make_unique<Dialog>();
    Dialog* d1 = first.get();
    nav().showDialog(std::move(first));
    focus().setFocus(d1->cancel);

    nav().showDialog(std::make_unique<Dialog>());
    EXPECT_EQ(nav().dialogDepth(), 2u);

    nav().closeDialog();
    EXPECT_EQ(nav().activeDialog(), d1);
    EXPECT_EQ(focus().current(), d1->cancel);
}

TEST_F(NavigatorTest, CloseWithoutDialogIsRefused) {
    push("home");
    EXPECT_FALSE(nav().closeDialog());
}

TEST_F(NavigatorTest, ClosedDialogLivesUntilFlush) {
    push("home");
    bool destroyed = false;
    nav().showDialog(std::make_unique<Dialog>(&destroyed));

    nav().closeDialog();
    EXPECT_FALSE(destroyed);

    nav().flushRetired();
    EXPECT_TRUE(destroyed);
}

TEST_F(NavigatorTest, PushingScreenClosesDialogs) {
    push("home");
    nav().showDialog(std::make_unique<Dialog>());
    push("next");

    EXPECT_FALSE(nav().hasDialog());
    EXPECT_EQ(nav().screenDepth(), 1u);
}

TEST_F(NavigatorTest, RemovedSavedFocusIsNotRestored) {
    auto* home = push("home");
    focus().setFocus(home->second);
    nav().showDialog(std::make_unique<Dialog>());

    // The covered screen drops the node that held focus
    engine.discard(*home, home->second);
    nav().flushRetired();

    nav().closeDialog();
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(focus().current(), nullptr);
}

TEST_F(NavigatorTest, RemovedSavedFocusIsNotRestoredOnPop) {
    auto* home = push("home");
    focus().setFocus(home->second);
    push("next");

    engine.discard(*home, home->second);
    nav().flushRetired();

    EXPECT_TRUE(nav().popScreen());
    EXPECT_EQ(nav().currentScreen(), home);
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(focus().current(), nullptr);
}

TEST_F(NavigatorTest, RollbackSkipsSavedFocusRemovedDuringInit) {
    auto* home = push("home");
    focus().setFocus(home->second);

    EXPECT_THROW(nav().pushScreen(std::make_unique<DiscardingScreen>(*home, home->second)),
                 InitializationError);
    EXPECT_EQ(nav().currentScreen(), home);
    EXPECT_EQ(focus().scope(), home);
    EXPECT_EQ(focus().current(), nullptr);

    nav().flushRetired();
    EXPECT_EQ(home->children().size(), 1u);
}
