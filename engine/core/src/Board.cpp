#include "tilemerge/core/Board.hpp"

#include <algorithm>

namespace tilemerge::core {

namespace {

// Maps (lane, distance from the target edge) onto a board cell so that one
// scan routine serves all four directions.
struct LaneTransform {
    Direction direction;
    int size;

    Cell At(int lane, int distance) const noexcept {
        const int far = size - 1 - distance;
        switch (direction) {
            case Direction::Right:
                return Cell{far, lane};
            case Direction::Left:
                return Cell{distance, lane};
            case Direction::Down:
                return Cell{lane, far};
            case Direction::Up:
            default:
                return Cell{lane, distance};
        }
    }
};

}  // namespace

const char* DirectionName(Direction direction) noexcept {
    switch (direction) {
        case Direction::Up:
            return "up";
        case Direction::Down:
            return "down";
        case Direction::Left:
            return "left";
        case Direction::Right:
            return "right";
    }
    return "unknown";
}

Board::Board(int size)
    : size_(std::max(0, size)),
      tiles_(static_cast<std::size_t>(size_) * static_cast<std::size_t>(size_)) {}

const Tile& Board::get(int col, int row) const noexcept {
    return tiles_[index(col, row)];
}

void Board::set(int col, int row, const Tile& tile) noexcept {
    tiles_[index(col, row)] = tile;
}

void Board::clearMergeFlags() noexcept {
    for (auto& tile : tiles_) {
        tile.merged_this_turn = false;
    }
}

bool Board::hasEmptyCell() const noexcept {
    return std::any_of(tiles_.begin(), tiles_.end(), [](const Tile& tile) { return tile.empty(); });
}

std::vector<Cell> Board::emptyCells() const {
    std::vector<Cell> cells;
    cells.reserve(tiles_.size());
    for (int row = 0; row < size_; ++row) {
        for (int col = 0; col < size_; ++col) {
            if (get(col, row).empty()) {
                cells.push_back(Cell{col, row});
            }
        }
    }
    return cells;
}

int Board::occupiedCount() const noexcept {
    return static_cast<int>(
        std::count_if(tiles_.begin(), tiles_.end(), [](const Tile& tile) { return tile.occupied(); }));
}

std::uint64_t Board::valueSum() const noexcept {
    std::uint64_t sum = 0;
    for (const auto& tile : tiles_) {
        sum += tile.value;
    }
    return sum;
}

std::vector<std::uint32_t> Board::values() const {
    std::vector<std::uint32_t> out;
    out.reserve(tiles_.size());
    for (const auto& tile : tiles_) {
        out.push_back(tile.value);
    }
    return out;
}

bool Board::operator==(const Board& other) const noexcept {
    return size_ == other.size_ && tiles_ == other.tiles_;
}

std::size_t Board::index(int col, int row) const noexcept {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(size_) +
           static_cast<std::size_t>(col);
}

SlideResult Slide(Board& board, Direction direction) {
    SlideResult result{};
    board.clearMergeFlags();

    const int size = board.size();
    const LaneTransform transform{direction, size};

    for (int lane = 0; lane < size; ++lane) {
        // The edge cell never moves, so scanning starts one step back from it.
        for (int distance = 1; distance < size; ++distance) {
            const Cell source = transform.At(lane, distance);
            const Tile tile = board.get(source);
            if (tile.empty()) {
                continue;
            }

            int settle = distance;
            bool merged = false;
            while (settle > 0) {
                const Cell next = transform.At(lane, settle - 1);
                const Tile& blocker = board.get(next);
                if (blocker.empty()) {
                    --settle;
                    continue;
                }
                if (blocker == tile && !blocker.merged_this_turn && !tile.merged_this_turn) {
                    const std::uint32_t doubled = tile.value * 2;
                    board.set(next, Tile{doubled, true});
                    board.set(source, Tile::Empty());
                    result.score += doubled;
                    result.merge_events.push_back(MergeEvent{next, doubled, tile.value});
                    merged = true;
                }
                break;
            }

            if (merged) {
                result.moved = true;
            } else if (settle != distance) {
                board.set(transform.At(lane, settle), tile);
                board.set(source, Tile::Empty());
                result.moved = true;
            }
        }
    }

    return result;
}

std::uint32_t RandomTileValue(RandomSource& rng) {
    return rng.NextInt(0, 1) == 0 ? 2u : 4u;
}

std::optional<Cell> SpawnRandomTile(Board& board, RandomSource& rng) {
    const auto empty = board.emptyCells();
    if (empty.empty()) {
        return std::nullopt;
    }
    const int pick = rng.NextInt(0, static_cast<int>(empty.size()) - 1);
    const Cell cell = empty[static_cast<std::size_t>(pick)];
    board.setValue(cell, RandomTileValue(rng));
    return cell;
}

Board NewBoard(int size, RandomSource& rng) {
    Board board(size);
    const int seeds = rng.NextInt(2, 3);
    for (int i = 0; i < seeds; ++i) {
        if (!SpawnRandomTile(board, rng)) {
            break;
        }
    }
    return board;
}

}  // namespace tilemerge::core
