#pragma once

#include <algorithm>

struct rgb {
    int r, g, b, a;

    rgb() : r(255), g(255), b(255), a(255) {}
    rgb(int r_in, int g_in, int b_in, int alpha = 255) : r(r_in), g(g_in), b(b_in), a(alpha) {}
};

// Linear mix from base toward tint, t in [0, 1]
inline rgb blend(const rgb& base, const rgb& tint, double t) {
    t = std::max(0.0, std::min(1.0, t));
    return rgb(static_cast<int>(tint.r * t + base.r * (1.0 - t)),
               static_cast<int>(tint.g * t + base.g * (1.0 - t)),
               static_cast<int>(tint.b * t + base.b * (1.0 - t)));
}

const rgb DIRT_COLOR(160, 82, 45);
const rgb HOME_TRAIL_COLOR(80, 70, 60);
const rgb FOOD_TRAIL_COLOR(255, 255, 255);
const rgb FOOD_COLOR(218, 165, 32);
const rgb NEST_COLOR(110, 50, 20);
const rgb SEARCHING_ANT_COLOR(50, 30, 20);
const rgb RETURNING_ANT_COLOR(218, 165, 32);

// Dirt darkened by the to-home trail, then lightened by the food trail
inline rgb field_color(double to_home, double food_trail, double max_intensity) {
    rgb c = blend(DIRT_COLOR, HOME_TRAIL_COLOR, to_home / max_intensity);
    return blend(c, FOOD_TRAIL_COLOR, food_trail / max_intensity);
}
