#include "Color.h"
#include <algorithm>
#include <cmath>

Color Color::from_hsl(float hue, float saturation, float lightness) {
    // Wrap hue into [0,360) so jittered or negative hues stay valid
    float h = std::fmod(hue, 360.0f);
    if (h < 0.0f) h += 360.0f;
    const float s = std::clamp(saturation, 0.0f, 100.0f) / 100.0f;
    const float l = std::clamp(lightness, 0.0f, 100.0f) / 100.0f;

    const float c = (1.0f - std::fabs(2.0f * l - 1.0f)) * s;
    const float x = c * (1.0f - std::fabs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
    const float m = l - c / 2.0f;

    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (h < 60.0f)       { r = c; g = x; b = 0; }
    else if (h < 120.0f) { r = x; g = c; b = 0; }
    else if (h < 180.0f) { r = 0; g = c; b = x; }
    else if (h < 240.0f) { r = 0; g = x; b = c; }
    else if (h < 300.0f) { r = x; g = 0; b = c; }
    else                 { r = c; g = 0; b = x; }

    return Color(r + m, g + m, b + m);
}

Color BouncePalette::random_color(std::mt19937& rng) {
    std::uniform_real_distribution<float> hue(0.0f, 360.0f);
    std::uniform_real_distribution<float> sat(MIN_SATURATION, MAX_SATURATION);
    std::uniform_real_distribution<float> light(MIN_LIGHTNESS, MAX_LIGHTNESS);
    const float h = hue(rng);
    const float s = sat(rng);
    const float l = light(rng);
    return Color::from_hsl(h, s, l);
}
