#include "tilemerge/core/TilePalette.hpp"

#include <algorithm>
#include <cmath>

namespace tilemerge::core {

namespace {

struct Hsv {
    float h = 0.0f;
    float s = 0.0f;
    float v = 0.0f;
};

int FloorLog2(std::uint32_t value) noexcept {
    int log = 0;
    while (value > 1) {
        value >>= 1;
        ++log;
    }
    return log;
}

Hsv ToHsv(Color color) noexcept {
    const float r = color.r / 255.0f;
    const float g = color.g / 255.0f;
    const float b = color.b / 255.0f;
    const float max = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float delta = max - min;

    Hsv hsv;
    hsv.v = max;
    hsv.s = max > 0.0f ? delta / max : 0.0f;
    if (delta <= 0.0f) {
        hsv.h = 0.0f;
    } else if (max == r) {
        hsv.h = 60.0f * std::fmod((g - b) / delta, 6.0f);
    } else if (max == g) {
        hsv.h = 60.0f * ((b - r) / delta + 2.0f);
    } else {
        hsv.h = 60.0f * ((r - g) / delta + 4.0f);
    }
    if (hsv.h < 0.0f) {
        hsv.h += 360.0f;
    }
    return hsv;
}

Color FromHsv(const Hsv& hsv, std::uint8_t alpha) noexcept {
    const float v = std::clamp(hsv.v, 0.0f, 1.0f);
    const float c = v * hsv.s;
    const float h = hsv.h / 60.0f;
    const float x = c * (1.0f - std::fabs(std::fmod(h, 2.0f) - 1.0f));
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    if (h < 1.0f) {
        r = c;
        g = x;
    } else if (h < 2.0f) {
        r = x;
        g = c;
    } else if (h < 3.0f) {
        g = c;
        b = x;
    } else if (h < 4.0f) {
        g = x;
        b = c;
    } else if (h < 5.0f) {
        r = x;
        b = c;
    } else {
        r = c;
        b = x;
    }
    const float m = v - c;
    auto channel = [m](float value) {
        return static_cast<std::uint8_t>(std::lround(std::clamp(value + m, 0.0f, 1.0f) * 255.0f));
    };
    return Color{channel(r), channel(g), channel(b), alpha};
}

}  // namespace

int PaletteSteps() noexcept {
    return FloorLog2(kPaletteMaxValue) + 2;
}

Color TileColor(std::uint32_t value) noexcept {
    if (value == 0) {
        return kTileBaseColor;
    }
    Hsv hsv = ToHsv(kTileBaseColor);
    hsv.v = 1.0f - (hsv.v / static_cast<float>(PaletteSteps()) * static_cast<float>(FloorLog2(value)));
    return FromHsv(hsv, kTileBaseColor.a);
}

}  // namespace tilemerge::core
