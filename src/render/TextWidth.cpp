#include "render/TextWidth.hpp"
#include <ftxui/screen/string.hpp>

std::vector<Glyph> splitGlyphs(const std::string& utf8) {
    // ftxui follows every full-width glyph with an empty string that
    // reserves its second column.
    auto raw = ftxui::Utf8ToGlyphs(utf8);

    std::vector<Glyph> out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i].empty()) continue;
        bool wide = (i + 1 < raw.size() && raw[i + 1].empty());
        out.push_back({raw[i], wide ? 2 : 1});
    }
    return out;
}

int displayWidth(const std::string& utf8) {
    return ftxui::string_width(utf8);
}

std::string truncateToWidth(const std::string& utf8, int maxColumns) {
    if (maxColumns <= 0) return {};

    std::string out;
    int used = 0;
    for (auto& g : splitGlyphs(utf8)) {
        if (used + g.width > maxColumns) break;
        out += g.text;
        used += g.width;
    }
    return out;
}
