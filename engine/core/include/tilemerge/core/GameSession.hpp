#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "tilemerge/core/Board.hpp"
#include "tilemerge/core/BoardGeometry.hpp"
#include "tilemerge/core/Particles.hpp"
#include "tilemerge/core/Random.hpp"

namespace tilemerge::core {

// Victory is reserved; no transition enters it.
enum class PlayState { Playing, GameOver, Victory };

const char* PlayStateName(PlayState state) noexcept;

struct SessionRules {
    int board_size = kDefaultBoardSize;
    BoardGeometry geometry{};
    ParticleRules particles{};
};

struct TurnResult {
    bool moved = false;
    std::uint32_t score_delta = 0;
    std::vector<MergeEvent> merges;
    std::optional<Cell> spawned;
    PlayState state = PlayState::Playing;
};

struct FrameInput {
    std::optional<Direction> direction;
    bool reset = false;
    float dt = 0.0f;
};

class GameSession {
public:
    // The session draws from `rng` for its whole lifetime; it must outlive
    // the session. The board is seeded immediately.
    GameSession(const SessionRules& rules, RandomSource& rng);

    void Reset();

    // One turn: slide, then spawn or end the game. Does nothing unless
    // Playing.
    TurnResult ApplyMove(Direction direction);

    // Reset, then the turn (if any), then the particle tick. Rendering and
    // PruneParticles() follow in the caller.
    std::optional<TurnResult> AdvanceFrame(const FrameInput& input);

    void TickParticles(float dt) { particles_.Tick(dt); }
    std::size_t PruneParticles() { return particles_.Prune(); }

    const Board& board() const noexcept { return board_; }
    Board& board() noexcept { return board_; }
    std::uint32_t score() const noexcept { return score_; }
    PlayState state() const noexcept { return state_; }
    const ParticleSystem& particles() const noexcept { return particles_; }
    ParticleSystem& particles() noexcept { return particles_; }
    const SessionRules& rules() const noexcept { return rules_; }

private:
    void SpawnMergeEffects(const std::vector<MergeEvent>& merges);

    SessionRules rules_;
    RandomSource& rng_;
    Board board_;
    std::uint32_t score_ = 0;
    PlayState state_ = PlayState::Playing;
    ParticleSystem particles_;
};

}  // namespace tilemerge::core
