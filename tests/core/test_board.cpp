#include <cassert>
#include <iostream>
#include <set>
#include <vector>

#include "TestSupport.hpp"
#include "tilemerge/core/Board.hpp"

using namespace tilemerge::core;
using tilemerge::test::BoardFromRows;
using tilemerge::test::ColumnValues;
using tilemerge::test::IsPowerOfTwo;
using tilemerge::test::RowValues;
using tilemerge::test::ScriptedRandom;

namespace {

using Values = std::vector<std::uint32_t>;

void TestTileEqualityIgnoresMergeFlag() {
    Tile a{8, true};
    Tile b{8, false};
    assert(a == b);
    assert(Tile::Occupied(8) != Tile::Occupied(16));
    assert(Tile::Empty().empty());
    assert(Tile::Occupied(2).occupied());
}

void TestChainOfThreeMergesNearestPair() {
    auto board = BoardFromRows({{2, 2, 2, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    auto result = Slide(board, Direction::Right);
    assert(result.moved);
    assert((RowValues(board, 0) == Values{0, 0, 2, 4}));
    assert(result.score == 4);
    assert(result.merge_events.size() == 1);
    assert((result.merge_events[0].cell == Cell{3, 0}));
    assert(result.merge_events[0].value == 4);
    assert(result.merge_events[0].source_value == 2);
}

void TestSlideLeftTwoPairs() {
    auto board = BoardFromRows({{2, 2, 4, 4}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    auto result = Slide(board, Direction::Left);
    assert(result.moved);
    assert((RowValues(board, 0) == Values{4, 8, 0, 0}));
    assert(result.score == 12);
    assert(result.merge_events.size() == 2);
    assert((result.merge_events[0].cell == Cell{0, 0}));
    assert(result.merge_events[0].value == 4);
    assert((result.merge_events[1].cell == Cell{1, 0}));
    assert(result.merge_events[1].value == 8);
}

void TestMergedTileBlocksSecondMerge() {
    auto board = BoardFromRows({{2, 2, 4, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    auto result = Slide(board, Direction::Right);
    assert((RowValues(board, 0) == Values{0, 0, 4, 4}));
    assert(result.score == 4);
    assert(result.merge_events.size() == 1);
    assert(board.get(2, 0).merged_this_turn);
    assert(!board.get(3, 0).merged_this_turn);

    // Flags from the previous slide do not leak into the next one.
    auto second = Slide(board, Direction::Right);
    assert((RowValues(board, 0) == Values{0, 0, 0, 8}));
    assert(second.score == 8);
}

void TestVerticalSlides() {
    auto up = BoardFromRows({{2, 0, 0, 0}, {0, 0, 0, 0}, {2, 0, 0, 0}, {4, 0, 0, 0}});
    auto down = up;

    auto up_result = Slide(up, Direction::Up);
    assert((ColumnValues(up, 0) == Values{4, 4, 0, 0}));
    assert(up_result.score == 4);
    assert((up_result.merge_events.at(0).cell == Cell{0, 0}));

    auto down_result = Slide(down, Direction::Down);
    assert((ColumnValues(down, 0) == Values{0, 0, 4, 4}));
    assert(down_result.score == 4);
    assert((down_result.merge_events.at(0).cell == Cell{0, 2}));
}

void TestAdjacentMergeCountsAsMove() {
    auto board = BoardFromRows({{0, 0, 2, 2}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    auto result = Slide(board, Direction::Right);
    assert(result.moved);
    assert((RowValues(board, 0) == Values{0, 0, 0, 4}));
}

void TestBlockedSlideIsNoOp() {
    auto board = BoardFromRows({{2, 4, 8, 16}, {4, 0, 0, 0}, {0, 0, 0, 0}, {8, 2, 0, 0}});
    const Board before = board;
    auto result = Slide(board, Direction::Left);
    assert(!result.moved);
    assert(result.score == 0);
    assert(result.merge_events.empty());
    assert(board == before);
    assert(board.values() == before.values());
}

void TestSlidesConserveValueAndNeverDoubleMerge() {
    MersenneRandom rng(/*seed=*/2024);
    const Direction directions[4] = {Direction::Up, Direction::Down, Direction::Left,
                                     Direction::Right};
    for (int game = 0; game < 20; ++game) {
        Board board = NewBoard(4, rng);
        for (int turn = 0; turn < 300; ++turn) {
            const auto sum_before = board.valueSum();
            auto result = Slide(board, directions[rng.NextInt(0, 3)]);
            assert(board.valueSum() == sum_before);

            std::uint32_t event_total = 0;
            std::set<Cell> targets;
            for (const auto& merge : result.merge_events) {
                event_total += merge.value;
                assert(merge.value == merge.source_value * 2);
                const bool first_merge_here = targets.insert(merge.cell).second;
                assert(first_merge_here);
                assert(board.get(merge.cell).merged_this_turn);
            }
            assert(event_total == result.score);

            for (int row = 0; row < board.size(); ++row) {
                for (int col = 0; col < board.size(); ++col) {
                    const auto& tile = board.get(col, row);
                    assert(tile.empty() || IsPowerOfTwo(tile.value));
                }
            }
            if (!SpawnRandomTile(board, rng) && !result.moved) {
                break;
            }
        }
    }
}

void TestSpawnTargetsOnlyEmptyCells() {
    auto full = BoardFromRows({{2, 4}, {8, 16}});
    const Board before = full;
    ScriptedRandom rng;
    const auto nothing = SpawnRandomTile(full, rng);
    assert(!nothing.has_value());
    assert(full == before);

    auto one_gap = BoardFromRows({{2, 4}, {0, 16}});
    rng.ints = {0, 1};
    auto spawned = SpawnRandomTile(one_gap, rng);
    assert(spawned.has_value());
    assert((*spawned == Cell{0, 1}));
    assert(one_gap.get(0, 1).value == 4);
    assert(!one_gap.hasEmptyCell());
}

void TestNewBoardSeedsTwoOrThreeTiles() {
    for (std::uint32_t seed = 1; seed <= 50; ++seed) {
        MersenneRandom rng(seed);
        Board board = NewBoard(kDefaultBoardSize, rng);
        assert(board.size() == kDefaultBoardSize);
        const int occupied = board.occupiedCount();
        assert(occupied == 2 || occupied == 3);
        for (auto value : board.values()) {
            assert(value == 0 || value == 2 || value == 4);
        }
    }

    ScriptedRandom scripted;
    scripted.ints = {3, 0, 0, 0, 1, 0, 1};
    Board board = NewBoard(3, scripted);
    assert(board.occupiedCount() == 3);
    assert(board.get(0, 0).value == 2);
    assert(board.get(1, 0).value == 4);
    assert(board.get(2, 0).value == 4);
}

}  // namespace

int main() {
    TestTileEqualityIgnoresMergeFlag();
    TestChainOfThreeMergesNearestPair();
    TestSlideLeftTwoPairs();
    TestMergedTileBlocksSecondMerge();
    TestVerticalSlides();
    TestAdjacentMergeCountsAsMove();
    TestBlockedSlideIsNoOp();
    TestSlidesConserveValueAndNeverDoubleMerge();
    TestSpawnTargetsOnlyEmptyCells();
    TestNewBoardSeedsTwoOrThreeTiles();
    std::cout << "All board tests passed.\n";
    return 0;
}
