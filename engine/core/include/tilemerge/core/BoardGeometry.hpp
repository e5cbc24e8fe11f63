#pragma once

#include "tilemerge/core/Types.hpp"

namespace tilemerge::core {

struct CellRect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

// Pixel placement of a square board: `cells` tiles separated and surrounded
// by `padding` inside an `extent`-sized square at (left, top).
struct BoardGeometry {
    float left = 50.0f;
    float top = 50.0f;
    float extent = 400.0f;
    float padding = 10.0f;
    int cells = 4;

    float cellSize() const noexcept;
    CellRect boardRect() const noexcept { return CellRect{left, top, extent, extent}; }
    CellRect cellRect(const Cell& cell) const noexcept;
    Point cellCenter(const Cell& cell) const noexcept;
};

}  // namespace tilemerge::core
