#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "tilemerge/core/Random.hpp"
#include "tilemerge/core/Types.hpp"

namespace tilemerge::core {

inline constexpr int kDefaultBoardSize = 4;
inline constexpr std::uint32_t kEmptyValue = 0;

struct Tile {
    std::uint32_t value = kEmptyValue;
    bool merged_this_turn = false;

    static constexpr Tile Empty() noexcept { return Tile{}; }
    static constexpr Tile Occupied(std::uint32_t value) noexcept { return Tile{value, false}; }

    constexpr bool empty() const noexcept { return value == kEmptyValue; }
    constexpr bool occupied() const noexcept { return !empty(); }

    // Identity is the value alone; the merge flag is per-turn bookkeeping.
    constexpr bool operator==(const Tile& other) const noexcept { return value == other.value; }
    constexpr bool operator!=(const Tile& other) const noexcept { return !(*this == other); }
};

class Board {
public:
    explicit Board(int size = kDefaultBoardSize);

    int size() const noexcept { return size_; }

    const Tile& get(int col, int row) const noexcept;
    const Tile& get(const Cell& cell) const noexcept { return get(cell.col, cell.row); }

    void set(int col, int row, const Tile& tile) noexcept;
    void set(const Cell& cell, const Tile& tile) noexcept { set(cell.col, cell.row, tile); }

    void setValue(int col, int row, std::uint32_t value) noexcept { set(col, row, Tile::Occupied(value)); }
    void setValue(const Cell& cell, std::uint32_t value) noexcept { setValue(cell.col, cell.row, value); }

    void clearMergeFlags() noexcept;

    bool hasEmptyCell() const noexcept;
    std::vector<Cell> emptyCells() const;
    int occupiedCount() const noexcept;
    std::uint64_t valueSum() const noexcept;

    // Row-major tile values, origin top-left.
    std::vector<std::uint32_t> values() const;

    bool operator==(const Board& other) const noexcept;
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    std::size_t index(int col, int row) const noexcept;

    int size_{0};
    std::vector<Tile> tiles_;
};

struct MergeEvent {
    Cell cell{};
    std::uint32_t value = 0;
    std::uint32_t source_value = 0;
};

struct SlideResult {
    bool moved = false;
    std::uint32_t score = 0;
    std::vector<MergeEvent> merge_events;
};

// Slides every tile toward the edge named by `direction`, merging equal
// neighbours at most once per tile. Merge flags are cleared on entry.
SlideResult Slide(Board& board, Direction direction);

// 2 or 4, equally likely.
std::uint32_t RandomTileValue(RandomSource& rng);

// Places one random tile on a uniformly chosen empty cell. Returns nullopt and
// leaves the board untouched when there is no empty cell.
std::optional<Cell> SpawnRandomTile(Board& board, RandomSource& rng);

// Empty board of `size` seeded with 2 or 3 random tiles.
Board NewBoard(int size, RandomSource& rng);

}  // namespace tilemerge::core
