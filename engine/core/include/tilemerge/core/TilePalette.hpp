#pragma once

#include <cstdint>

#include "tilemerge/core/Types.hpp"

namespace tilemerge::core {

inline constexpr Color kTileBaseColor{0x44, 0x44, 0xff, 0xff};
inline constexpr std::uint32_t kPaletteMaxValue = 2048;

// Number of brightness steps: log2(kPaletteMaxValue) + 2.
int PaletteSteps() noexcept;

// Base color darkened by log2(value) steps in HSV space. Empty maps to the
// base color.
Color TileColor(std::uint32_t value) noexcept;

}  // namespace tilemerge::core
