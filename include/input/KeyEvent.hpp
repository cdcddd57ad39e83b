#pragma once
#include <string>

enum class Key {
    Character,   // printable text, see KeyEvent::text
    Enter,
    Tab,
    BackTab,     // Shift+Tab
    Backspace,
    Escape,
    Up, Down, Left, Right,
    Home, End, PageUp, PageDown,
    Insert, Delete,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Unknown
};

struct KeyEvent {
    Key         key   = Key::Unknown;
    std::string text;          // UTF-8, only for Key::Character
    bool        ctrl  = false;
    bool        alt   = false;
    bool        shift = false;

    static KeyEvent character(const std::string& utf8) {
        KeyEvent e;
        e.key  = Key::Character;
        e.text = utf8;
        return e;
    }

    static KeyEvent special(Key k) {
        KeyEvent e;
        e.key = k;
        return e;
    }

    static KeyEvent ctrlChar(char letter) {
        KeyEvent e = character(std::string(1, letter));
        e.ctrl = true;
        return e;
    }

    // Plain (unmodified) character test, e.g. ev.is('q')
    bool is(char c) const {
        return key == Key::Character && !ctrl && !alt &&
               text.size() == 1 && text[0] == c;
    }

    bool isPrintable() const {
        return key == Key::Character && !ctrl && !alt && !text.empty();
    }

    bool operator==(const KeyEvent& o) const {
        return key == o.key && text == o.text && ctrl == o.ctrl &&
               alt == o.alt && shift == o.shift;
    }

    // "Ctrl+x", "Up", "Shift+Tab" ... for logging
    std::string describe() const;
};

const char* keyName(Key k);
