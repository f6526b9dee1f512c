#pragma once
#include <random>

// Color as 3-component vector (RGB, each channel in [0,1])
struct Color {
    float r, g, b;

    Color() : r(0), g(0), b(0) {}
    Color(float r, float g, float b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // hue in degrees [0,360), saturation and lightness in percent [0,100]
    static Color from_hsl(float hue, float saturation, float lightness);
};

// Palette used when a particle hits a wall: hue U[0,360], sat U[50,100], light U[30,90]
struct BouncePalette {
    static constexpr float MIN_SATURATION = 50.0f;
    static constexpr float MAX_SATURATION = 100.0f;
    static constexpr float MIN_LIGHTNESS  = 30.0f;
    static constexpr float MAX_LIGHTNESS  = 90.0f;

    static Color random_color(std::mt19937& rng);
};
