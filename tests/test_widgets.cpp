#include <gtest/gtest.h>
#include "app/Engine.hpp"
#include "term/StringTerminal.hpp"
#include "widgets/Box.hpp"
#include "widgets/Button.hpp"
#include "widgets/Label.hpp"
#include "widgets/TextField.hpp"

class WidgetTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame.clear(theme.background, theme.foreground);
    }

    void type(TextField& field, const std::string& text) {
        for (auto& g : splitGlyphs(text))
            field.handleInput(engine, KeyEvent::character(g.text));
    }

    bool press(Node& node, Key k) {
        return node.handleInput(engine, KeyEvent::special(k));
    }

    StringTerminal term;
    Engine engine{term};
    Theme theme;
    FrameBuffer frame{30, 6};
    RenderContext ctx{frame, theme};
};

// ── Label ───────────────────────────────────────────────────────────────

TEST_F(WidgetTest, LabelSizesToText) {
    Label label("hello");
    EXPECT_EQ(label.width, 5);
    EXPECT_EQ(label.height, 1);

    label.setText("漢字");
    EXPECT_EQ(label.width, 4);

    label.setAutoSize(false);
    label.width = 10;
    label.setText("x");
    EXPECT_EQ(label.width, 10);
}

TEST_F(WidgetTest, LabelRendersClipped) {
    Label label("abcdef");
    label.setAutoSize(false);
    label.setPosition(2, 1);
    label.width = 3;
    label.setColor(theme.accent);
    label.render(ctx);

    EXPECT_EQ(frame.backRowText(1).substr(0, 6), "  abc ");
    EXPECT_EQ(frame.back(2, 1).fg, theme.accent);
}

// ── Button ──────────────────────────────────────────────────────────────

TEST_F(WidgetTest, ButtonPressesOnEnterAndSpace) {
    int calls = 0;
    Button button("OK", [&](Engine&) { calls++; });
    EXPECT_TRUE(button.focusable);
    EXPECT_EQ(button.width, 6);

    EXPECT_TRUE(press(button, Key::Enter));
    EXPECT_TRUE(button.handleInput(engine, KeyEvent::character(" ")));
    EXPECT_FALSE(button.handleInput(engine, KeyEvent::character("x")));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(button.pressCount(), 2);
}

TEST_F(WidgetTest, ButtonRendersCaption) {
    Button button("Go", nullptr);
    button.setPosition(1, 0);
    button.render(ctx);
    EXPECT_EQ(frame.backRowText(0).substr(1, 6), "[ Go ]");
    EXPECT_EQ(frame.back(1, 0).fg, theme.accent);
}

// ── TextField ───────────────────────────────────────────────────────────

TEST_F(WidgetTest, TextFieldEditing) {
    TextField field;
    type(field, "helo");
    EXPECT_EQ(field.value(), "helo");
    EXPECT_EQ(field.cursor(), 4u);

    press(field, Key::Left);
    type(field, "l");
    EXPECT_EQ(field.value(), "hello");

    press(field, Key::Home);
    press(field, Key::Delete);
    EXPECT_EQ(field.value(), "ello");

    press(field, Key::End);
    press(field, Key::Backspace);
    EXPECT_EQ(field.value(), "ell");
    EXPECT_EQ(field.cursor(), 3u);
}

TEST_F(WidgetTest, TextFieldEdgesAreHarmless) {
    TextField field;
    EXPECT_TRUE(press(field, Key::Backspace));
    EXPECT_TRUE(press(field, Key::Delete));
    EXPECT_TRUE(press(field, Key::Left));
    EXPECT_EQ(field.value(), "");
    EXPECT_FALSE(press(field, Key::Up));
    EXPECT_FALSE(field.handleInput(engine, KeyEvent::ctrlChar('a')));
}

TEST_F(WidgetTest, TextFieldTreatsWideGlyphAsOneUnit) {
    TextField field;
    type(field, "a漢b");
    EXPECT_EQ(field.cursor(), 3u);

    press(field, Key::Left);
    press(field, Key::Backspace);
    EXPECT_EQ(field.value(), "ab");
}

TEST_F(WidgetTest, TextFieldMaxLength) {
    TextField field;
    field.setMaxLength(3);
    type(field, "abcdef");
    EXPECT_EQ(field.value(), "abc");

    field.setValue("wxyz");
    EXPECT_EQ(field.value(), "wxy");
}

TEST_F(WidgetTest, TextFieldCallbacks) {
    TextField field;
    std::string changed, submitted;
    field.setOnChange([&](Engine&, const std::string& v) { changed = v; });

    EXPECT_FALSE(press(field, Key::Enter));

    field.setOnSubmit([&](Engine&, const std::string& v) { submitted = v; });
    type(field, "ok");
    EXPECT_EQ(changed, "ok");
    EXPECT_TRUE(press(field, Key::Enter));
    EXPECT_EQ(submitted, "ok");
}

TEST_F(WidgetTest, TextFieldShowsPlaceholderWhenEmpty) {
    TextField field(10, "name");
    field.setPosition(0, 2);
    field.render(ctx);
    EXPECT_EQ(frame.backRowText(2).substr(0, 10), "name      ");
    EXPECT_EQ(frame.back(0, 2).fg, theme.muted);
}

TEST_F(WidgetTest, TextFieldScrollsToCursor) {
    TextField field(4);
    field.setValue("abcdefgh");
    field.render(ctx);
    // Last column is kept free for the cursor past the end
    EXPECT_EQ(frame.backRowText(0).substr(0, 4), "fgh ");
}

// ── Box ─────────────────────────────────────────────────────────────────

TEST_F(WidgetTest, BoxStretchesChildrenInsideBorder) {
    Box box("Title");
    box.setPosition(2, 1);
    box.setSize(10, 5);
    auto& inner = box.emplaceChild<Node>("inner");
    box.arrange();

    EXPECT_EQ(inner.x, 3);
    EXPECT_EQ(inner.y, 2);
    EXPECT_EQ(inner.width, 8);
    EXPECT_EQ(inner.height, 3);
}

TEST_F(WidgetTest, BoxDrawsTitleAndFocusBorder) {
    Node root("root");
    auto& box = root.emplaceChild<Box>("Tasks");
    box.setSize(20, 4);
    auto& button = box.emplaceChild<Button>("x", nullptr);

    box.render(ctx);
    EXPECT_NE(frame.backRowText(0).find(" Tasks "), std::string::npos);
    EXPECT_EQ(frame.back(0, 0).fg, theme.muted);

    engine.focus().setScope(&root);
    ASSERT_TRUE(engine.focus().setFocus(&button));
    box.render(ctx);
    EXPECT_EQ(frame.back(0, 0).fg, theme.focus);
}
