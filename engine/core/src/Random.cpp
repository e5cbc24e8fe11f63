#include "tilemerge/core/Random.hpp"

#include <utility>

namespace tilemerge::core {

MersenneRandom::MersenneRandom(std::uint32_t seed) : engine_(seed) {}

int MersenneRandom::NextInt(int lo, int hi) {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

float MersenneRandom::NextFloat(float lo, float hi) {
    if (!(lo < hi)) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    const float value = dist(engine_);
    // uniform_real_distribution<float> may round up to hi.
    return value < hi ? value : lo;
}

}  // namespace tilemerge::core
