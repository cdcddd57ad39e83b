#pragma once
#include <cstdint>
#include <string>

// 24-bit terminal color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }

    static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b) {
        return Color{r, g, b};
    }

    // Parses "#rrggbb" (leading '#' optional). Throws std::invalid_argument.
    static Color fromHex(const std::string& hex);
    std::string toHex() const;
};

// One terminal position. Replaced wholesale on every write.
struct Cell {
    std::string ch = " ";    // one UTF-8 grapheme
    Color fg = Color::rgb(220, 220, 220);
    Color bg = Color::rgb(0, 0, 0);
    uint8_t width = 1;       // 1 narrow, 2 wide lead, 0 wide placeholder

    bool operator==(const Cell& o) const {
        return ch == o.ch && fg == o.fg && bg == o.bg && width == o.width;
    }
    bool operator!=(const Cell& o) const { return !(*this == o); }

    bool isPlaceholder() const { return width == 0; }
    bool isWide() const { return width == 2; }
};
