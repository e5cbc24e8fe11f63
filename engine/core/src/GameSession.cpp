#include "tilemerge/core/GameSession.hpp"

#include <utility>

#include "tilemerge/core/TilePalette.hpp"

namespace tilemerge::core {

const char* PlayStateName(PlayState state) noexcept {
    switch (state) {
        case PlayState::Playing:
            return "playing";
        case PlayState::GameOver:
            return "game over";
        case PlayState::Victory:
            return "victory";
    }
    return "unknown";
}

GameSession::GameSession(const SessionRules& rules, RandomSource& rng)
    : rules_(rules), rng_(rng), board_(rules.board_size), particles_(rules.particles) {
    rules_.geometry.cells = rules_.board_size;
    Reset();
}

void GameSession::Reset() {
    board_ = NewBoard(rules_.board_size, rng_);
    score_ = 0;
    state_ = PlayState::Playing;
    particles_.Clear();
}

TurnResult GameSession::ApplyMove(Direction direction) {
    TurnResult turn{};
    turn.state = state_;
    if (state_ != PlayState::Playing) {
        return turn;
    }

    SlideResult slide = Slide(board_, direction);
    if (slide.moved) {
        board_.clearMergeFlags();
        score_ += slide.score;
        SpawnMergeEffects(slide.merge_events);

        turn.moved = true;
        turn.score_delta = slide.score;
        turn.merges = std::move(slide.merge_events);
    }

    // The end check looks for an empty cell, not for a legal slide: a full
    // board ends the game on the first input that leaves it full, even when
    // another direction could still merge.
    if (board_.hasEmptyCell()) {
        if (turn.moved) {
            turn.spawned = SpawnRandomTile(board_, rng_);
        }
    } else {
        state_ = PlayState::GameOver;
    }
    turn.state = state_;
    return turn;
}

std::optional<TurnResult> GameSession::AdvanceFrame(const FrameInput& input) {
    if (input.reset) {
        Reset();
    }
    std::optional<TurnResult> turn;
    if (state_ == PlayState::Playing && input.direction) {
        turn = ApplyMove(*input.direction);
    }
    TickParticles(input.dt);
    return turn;
}

void GameSession::SpawnMergeEffects(const std::vector<MergeEvent>& merges) {
    for (const auto& merge : merges) {
        const Point center = rules_.geometry.cellCenter(merge.cell);
        particles_.SpawnBurst(center.x, center.y, TileColor(merge.source_value), rng_);
    }
}

}  // namespace tilemerge::core
