#pragma once
#include <string>
#include <vector>

// A single displayable glyph and the number of columns it occupies.
struct Glyph {
    std::string text;
    int         width = 1;   // 1 or 2
};

// Splits UTF-8 into glyphs. Control characters are dropped and combining
// marks stay attached to the glyph they modify.
std::vector<Glyph> splitGlyphs(const std::string& utf8);

// Total columns the text occupies on screen
int displayWidth(const std::string& utf8);

// Longest prefix of the text that fits in maxColumns
std::string truncateToWidth(const std::string& utf8, int maxColumns);
