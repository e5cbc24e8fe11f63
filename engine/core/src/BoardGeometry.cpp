#include "tilemerge/core/BoardGeometry.hpp"

#include <algorithm>

namespace tilemerge::core {

float BoardGeometry::cellSize() const noexcept {
    if (cells <= 0) {
        return 0.0f;
    }
    return std::max(0.0f, (extent - padding * static_cast<float>(cells + 1)) / static_cast<float>(cells));
}

CellRect BoardGeometry::cellRect(const Cell& cell) const noexcept {
    const float size = cellSize();
    CellRect rect;
    rect.x = left + padding * static_cast<float>(cell.col + 1) + static_cast<float>(cell.col) * size;
    rect.y = top + padding * static_cast<float>(cell.row + 1) + static_cast<float>(cell.row) * size;
    rect.w = size;
    rect.h = size;
    return rect;
}

Point BoardGeometry::cellCenter(const Cell& cell) const noexcept {
    const CellRect rect = cellRect(cell);
    return Point{rect.x + rect.w * 0.5f, rect.y + rect.h * 0.5f};
}

}  // namespace tilemerge::core
