#pragma once
#include "render/Cell.hpp"
#include <nlohmann/json.hpp>

// Colors the runtime itself needs; application palettes live elsewhere.
struct Theme {
    Color background = Color::rgb(24, 24, 32);
    Color foreground = Color::rgb(220, 220, 220);
    Color accent     = Color::rgb(97, 175, 239);
    Color muted      = Color::rgb(110, 110, 130);
    Color focus      = Color::rgb(229, 192, 123);

    // Missing keys keep their defaults
    static Theme fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};
