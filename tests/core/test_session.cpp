#include <cassert>
#include <cmath>
#include <iostream>

#include "TestSupport.hpp"
#include "tilemerge/core/GameSession.hpp"
#include "tilemerge/core/TilePalette.hpp"

using namespace tilemerge::core;
using tilemerge::test::BoardFromRows;
using tilemerge::test::RowValues;

namespace {

using Values = std::vector<std::uint32_t>;

void AssertFreshSession(const GameSession& session) {
    const int occupied = session.board().occupiedCount();
    assert(occupied == 2 || occupied == 3);
    for (auto value : session.board().values()) {
        assert(value == 0 || value == 2 || value == 4);
    }
    assert(session.score() == 0);
    assert(session.state() == PlayState::Playing);
    assert(session.particles().empty());
}

void TestConstructionAndResetSeedBoard() {
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        MersenneRandom rng(seed);
        GameSession session(SessionRules{}, rng);
        AssertFreshSession(session);

        session.board() = BoardFromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
        session.ApplyMove(Direction::Left);
        assert(session.score() == 4);
        assert(!session.particles().empty());

        session.Reset();
        AssertFreshSession(session);
    }
}

void TestMergeTurnScoresSpawnsAndBursts() {
    MersenneRandom rng(/*seed=*/3);
    SessionRules rules;
    GameSession session(rules, rng);
    session.board() = BoardFromRows({{2, 2, 4, 4}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});

    TurnResult turn = session.ApplyMove(Direction::Left);
    assert(turn.moved);
    assert(turn.score_delta == 12);
    assert(session.score() == 12);
    assert(turn.merges.size() == 2);
    assert((turn.merges[0].cell == Cell{0, 0}));
    assert((turn.merges[1].cell == Cell{1, 0}));
    assert(turn.state == PlayState::Playing);

    assert(turn.spawned.has_value());
    const auto& spawned = session.board().get(*turn.spawned);
    assert(spawned.value == 2 || spawned.value == 4);
    assert(session.board().occupiedCount() == 3);
    assert(session.board().get(0, 0).value == 4);
    assert(session.board().get(1, 0).value == 8);

    for (int row = 0; row < session.board().size(); ++row) {
        for (int col = 0; col < session.board().size(); ++col) {
            assert(!session.board().get(col, row).merged_this_turn);
        }
    }

    const auto burst = static_cast<std::size_t>(rules.particles.burst_count);
    const auto& particles = session.particles().particles();
    assert(particles.size() == burst * 2);
    const Point first_center = session.rules().geometry.cellCenter(Cell{0, 0});
    assert(particles.front().x == first_center.x && particles.front().y == first_center.y);
    assert(particles.front().color == TileColor(2));
    assert(particles.back().color == TileColor(4));
}

void TestStillSlideSpawnsNothing() {
    MersenneRandom rng(/*seed=*/5);
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows({{2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});

    for (Direction direction : {Direction::Left, Direction::Up}) {
        TurnResult turn = session.ApplyMove(direction);
        assert(!turn.moved);
        assert(!turn.spawned.has_value());
        assert(turn.state == PlayState::Playing);
    }
    assert(session.board().occupiedCount() == 1);
    assert(session.score() == 0);
    assert(session.particles().empty());
}

void TestFullBoardEndsOnStuckInput() {
    MersenneRandom rng(/*seed=*/9);
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows(
        {{2, 4, 8, 16}, {2, 4, 8, 16}, {2, 4, 8, 16}, {2, 4, 8, 16}});
    const Board before = session.board();

    // Up could merge every column, but only the empty-cell check decides.
    TurnResult turn = session.ApplyMove(Direction::Left);
    assert(!turn.moved);
    assert(turn.state == PlayState::GameOver);
    assert(session.state() == PlayState::GameOver);
    assert(session.board() == before);

    TurnResult ignored = session.ApplyMove(Direction::Up);
    assert(!ignored.moved);
    assert(ignored.state == PlayState::GameOver);
    assert(session.board() == before);

    session.Reset();
    AssertFreshSession(session);
}

void TestFullBoardWithMergeKeepsPlaying() {
    MersenneRandom rng(/*seed=*/11);
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows(
        {{2, 2, 4, 8}, {4, 8, 16, 32}, {8, 16, 32, 64}, {16, 32, 64, 128}});

    TurnResult turn = session.ApplyMove(Direction::Left);
    assert(turn.moved);
    assert(turn.score_delta == 4);
    assert(turn.state == PlayState::Playing);
    assert(turn.spawned.has_value());
    assert((*turn.spawned == Cell{3, 0}));
    assert((RowValues(session.board(), 0)[0] == 4));
    assert(!session.board().hasEmptyCell());
    assert(session.state() == PlayState::Playing);
}

void TestRandomPlayKeepsInvariants() {
    MersenneRandom rng(/*seed=*/77);
    GameSession session(SessionRules{}, rng);
    MersenneRandom picker(/*seed=*/78);
    const Direction directions[4] = {Direction::Up, Direction::Down, Direction::Left,
                                     Direction::Right};
    std::uint32_t expected_score = 0;

    for (int i = 0; i < 5000 && session.state() == PlayState::Playing; ++i) {
        const Board before = session.board();
        const int occupied_before = before.occupiedCount();
        TurnResult turn = session.ApplyMove(directions[picker.NextInt(0, 3)]);
        assert(turn.state != PlayState::Victory);

        if (!turn.moved) {
            assert(session.board() == before);
            assert(!turn.spawned.has_value());
            continue;
        }
        expected_score += turn.score_delta;
        assert(session.score() == expected_score);

        std::uint64_t spawned_value = 0;
        int spawned_count = 0;
        if (turn.spawned) {
            spawned_value = session.board().get(*turn.spawned).value;
            spawned_count = 1;
        }
        assert(session.board().valueSum() == before.valueSum() + spawned_value);
        assert(session.board().occupiedCount() ==
               occupied_before - static_cast<int>(turn.merges.size()) + spawned_count);
        session.PruneParticles();
    }
    assert(session.state() != PlayState::Victory);
}

void TestAdvanceFrameOrdersResetMoveAndTick() {
    MersenneRandom rng(/*seed=*/21);
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});

    FrameInput frame;
    frame.direction = Direction::Right;
    frame.dt = 0.1f;
    auto turn = session.AdvanceFrame(frame);
    assert(turn.has_value() && turn->moved);
    assert(session.score() == 4);
    const auto& particle = session.particles().particles().front();
    const Point center = session.rules().geometry.cellCenter(Cell{3, 0});
    assert(std::fabs(particle.x - center.x) <= 5.0f);
    assert(std::fabs(particle.y - center.y) <= 5.0f);
    assert(particle.life < 230.0f);

    FrameInput idle;
    idle.dt = 0.1f;
    assert(!session.AdvanceFrame(idle).has_value());

    session.board() = BoardFromRows(
        {{2, 4, 8, 16}, {16, 8, 4, 2}, {2, 4, 8, 16}, {16, 8, 4, 2}});
    FrameInput stuck;
    stuck.direction = Direction::Left;
    session.AdvanceFrame(stuck);
    assert(session.state() == PlayState::GameOver);
    assert(!session.AdvanceFrame(stuck).has_value());

    FrameInput reset;
    reset.reset = true;
    session.AdvanceFrame(reset);
    assert(session.state() == PlayState::Playing);
    assert(session.score() == 0);
}

void TestResetAndDirectionInOneFrame() {
    tilemerge::test::ScriptedRandom rng;
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows(
        {{2, 4, 8, 16}, {16, 8, 4, 2}, {2, 4, 8, 16}, {16, 8, 4, 2}});
    session.ApplyMove(Direction::Left);
    assert(session.state() == PlayState::GameOver);

    // Two seeds, both 2, at (0,0) and (1,0); the post-move spawn takes (0,0).
    rng.ints = {2, 0, 0, 0, 0};
    FrameInput frame;
    frame.reset = true;
    frame.direction = Direction::Right;
    frame.dt = 0.1f;
    auto turn = session.AdvanceFrame(frame);

    assert(session.state() == PlayState::Playing);
    assert(turn.has_value() && turn->moved);
    assert(session.score() == 4);
    assert(RowValues(session.board(), 0) == (Values{2, 0, 0, 4}));

    // Unscripted bursts start at size 5, velocity -50 and life 150; one tick
    // of 0.1s leaves life 130 and moves each particle 5 pixels up-left.
    const Point center = session.rules().geometry.cellCenter(Cell{3, 0});
    assert(session.particles().size() == 20);
    for (const auto& particle : session.particles().particles()) {
        assert(std::fabs(particle.life - 130.0f) < 1e-3f);
        assert(std::fabs(particle.x - (center.x - 5.0f)) < 1e-3f);
        assert(std::fabs(particle.y - (center.y - 5.0f)) < 1e-3f);
    }
}

void TestParticlesExpireThroughFrames() {
    MersenneRandom rng(/*seed=*/31);
    GameSession session(SessionRules{}, rng);
    session.board() = BoardFromRows({{4, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    session.ApplyMove(Direction::Left);
    assert(!session.particles().empty());

    // Longest possible life is 250 at 200 per second.
    FrameInput frame;
    frame.dt = 0.1f;
    for (int i = 0; i < 13; ++i) {
        session.AdvanceFrame(frame);
        session.PruneParticles();
    }
    assert(session.particles().empty());
}

}  // namespace

int main() {
    TestConstructionAndResetSeedBoard();
    TestMergeTurnScoresSpawnsAndBursts();
    TestStillSlideSpawnsNothing();
    TestFullBoardEndsOnStuckInput();
    TestFullBoardWithMergeKeepsPlaying();
    TestRandomPlayKeepsInvariants();
    TestAdvanceFrameOrdersResetMoveAndTick();
    TestResetAndDirectionInOneFrame();
    TestParticlesExpireThroughFrames();
    std::cout << "All session tests passed.\n";
    return 0;
}
