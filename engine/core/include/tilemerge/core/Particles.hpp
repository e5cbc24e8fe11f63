#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tilemerge/core/Random.hpp"
#include "tilemerge/core/Types.hpp"

namespace tilemerge::core {

struct ParticleRules {
    int burst_count = 20;
    int size_min = 5;
    int size_max = 9;
    float speed = 50.0f;
    float life_min = 150.0f;
    float life_max = 250.0f;
    // Life value that maps to full opacity.
    float reference_life = 200.0f;
    // Life lost per second.
    float life_decay = 200.0f;
    // Velocity lost per second on each axis.
    float friction = 20.0f;
};

struct Particle {
    float x = 0.0f;
    float y = 0.0f;
    int size = 0;
    float vel_x = 0.0f;
    float vel_y = 0.0f;
    Color color{};
    float life = 0.0f;

    bool visible() const noexcept { return life > 0.0f; }
    bool dead() const noexcept { return life < 0.0f; }
};

struct ParticleSprite {
    float x = 0.0f;
    float y = 0.0f;
    int size = 0;
    Color color{};
    std::uint8_t alpha = 0;
};

// Moves `value` toward zero by `amount` without crossing it.
float DecreaseAbs(float value, float amount) noexcept;

class ParticleSystem {
public:
    explicit ParticleSystem(const ParticleRules& rules = ParticleRules{});

    const ParticleRules& rules() const noexcept { return rules_; }

    void SpawnBurst(float x, float y, Color color, int count, RandomSource& rng);
    void SpawnBurst(float x, float y, Color color, RandomSource& rng) {
        SpawnBurst(x, y, color, rules_.burst_count, rng);
    }

    void Tick(float dt);

    // Drops particles whose life has gone below zero. Returns how many went.
    std::size_t Prune();

    void Clear() noexcept { particles_.clear(); }

    std::uint8_t AlphaFor(const Particle& particle) const noexcept;

    // Drawable state of every particle that is still visible.
    std::vector<ParticleSprite> Snapshot() const;

    const std::vector<Particle>& particles() const noexcept { return particles_; }
    std::vector<Particle>& particles() noexcept { return particles_; }
    std::size_t size() const noexcept { return particles_.size(); }
    bool empty() const noexcept { return particles_.empty(); }

private:
    ParticleRules rules_;
    std::vector<Particle> particles_;
};

}  // namespace tilemerge::core
