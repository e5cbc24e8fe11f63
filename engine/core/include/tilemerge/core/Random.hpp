#pragma once

#include <cstdint>
#include <random>

namespace tilemerge::core {

// Every random draw the game makes goes through this interface so tests can
// substitute a seeded or scripted source.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [lo, hi].
    virtual int NextInt(int lo, int hi) = 0;

    // Uniform float in [lo, hi).
    virtual float NextFloat(float lo, float hi) = 0;
};

class MersenneRandom final : public RandomSource {
public:
    explicit MersenneRandom(std::uint32_t seed = std::random_device{}());

    int NextInt(int lo, int hi) override;
    float NextFloat(float lo, float hi) override;

private:
    std::mt19937 engine_;
};

}  // namespace tilemerge::core
