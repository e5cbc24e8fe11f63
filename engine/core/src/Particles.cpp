#include "tilemerge/core/Particles.hpp"

#include <algorithm>

namespace tilemerge::core {

float DecreaseAbs(float value, float amount) noexcept {
    if (value > 0.0f) {
        value -= amount;
        return value < 0.0f ? 0.0f : value;
    }
    if (value < 0.0f) {
        value += amount;
        return value > 0.0f ? 0.0f : value;
    }
    return 0.0f;
}

ParticleSystem::ParticleSystem(const ParticleRules& rules) : rules_(rules) {}

void ParticleSystem::SpawnBurst(float x, float y, Color color, int count, RandomSource& rng) {
    if (count <= 0) {
        return;
    }
    particles_.reserve(particles_.size() + static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        Particle particle;
        particle.x = x;
        particle.y = y;
        particle.size = rng.NextInt(rules_.size_min, rules_.size_max);
        particle.vel_x = rng.NextFloat(-rules_.speed, rules_.speed);
        particle.vel_y = rng.NextFloat(-rules_.speed, rules_.speed);
        particle.color = color;
        particle.life = rng.NextFloat(rules_.life_min, rules_.life_max);
        particles_.push_back(particle);
    }
}

void ParticleSystem::Tick(float dt) {
    const float friction = rules_.friction * dt;
    const float decay = rules_.life_decay * dt;
    for (auto& particle : particles_) {
        particle.x += particle.vel_x * dt;
        particle.y += particle.vel_y * dt;
        particle.life -= decay;
        particle.vel_x = DecreaseAbs(particle.vel_x, friction);
        particle.vel_y = DecreaseAbs(particle.vel_y, friction);
    }
}

std::size_t ParticleSystem::Prune() {
    const auto before = particles_.size();
    particles_.erase(std::remove_if(particles_.begin(), particles_.end(),
                                    [](const Particle& particle) { return particle.dead(); }),
                     particles_.end());
    return before - particles_.size();
}

std::uint8_t ParticleSystem::AlphaFor(const Particle& particle) const noexcept {
    if (rules_.reference_life <= 0.0f) {
        return 0;
    }
    const float ratio = std::clamp(particle.life / rules_.reference_life, 0.0f, 1.0f);
    return static_cast<std::uint8_t>(ratio * 255.0f);
}

std::vector<ParticleSprite> ParticleSystem::Snapshot() const {
    std::vector<ParticleSprite> sprites;
    sprites.reserve(particles_.size());
    for (const auto& particle : particles_) {
        if (!particle.visible()) {
            continue;
        }
        sprites.push_back(ParticleSprite{particle.x, particle.y, particle.size, particle.color,
                                         AlphaFor(particle)});
    }
    return sprites;
}

}  // namespace tilemerge::core
