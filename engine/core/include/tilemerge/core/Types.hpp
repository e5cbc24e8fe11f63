#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tilemerge::core {

struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

enum class Direction { Up, Down, Left, Right };

struct Point {
    float x{};
    float y{};
};

struct Color {
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};
    std::uint8_t a{255};

    constexpr bool operator==(const Color& other) const noexcept {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const noexcept {
        return !(*this == other);
    }
};

const char* DirectionName(Direction direction) noexcept;

}  // namespace tilemerge::core
