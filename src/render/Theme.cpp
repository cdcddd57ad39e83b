#include "render/Theme.hpp"
#include <cstdio>
#include <stdexcept>

Color Color::fromHex(const std::string& hex) {
    std::string s = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (s.size() != 6)
        throw std::invalid_argument("color must be #rrggbb: '" + hex + "'");

    auto nibble = [&](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("bad hex digit in color '" + hex + "'");
    };

    auto byteAt = [&](size_t i) {
        return static_cast<uint8_t>(nibble(s[i]) * 16 + nibble(s[i + 1]));
    };
    return Color{byteAt(0), byteAt(2), byteAt(4)};
}

std::string Color::toHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

Theme Theme::fromJson(const nlohmann::json& j) {
    Theme t;
    if (!j.is_object()) return t;

    auto read = [&](const char* key, Color& out) {
        if (j.contains(key) && j[key].is_string())
            out = Color::fromHex(j[key].get<std::string>());
    };
    read("background", t.background);
    read("foreground", t.foreground);
    read("accent",     t.accent);
    read("muted",      t.muted);
    read("focus",      t.focus);
    return t;
}

nlohmann::json Theme::toJson() const {
    return {
        {"background", background.toHex()},
        {"foreground", foreground.toHex()},
        {"accent",     accent.toHex()},
        {"muted",      muted.toHex()},
        {"focus",      focus.toHex()}
    };
}
