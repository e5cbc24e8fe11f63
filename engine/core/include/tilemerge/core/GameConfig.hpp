#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "tilemerge/core/GameSession.hpp"
#include "tilemerge/core/Json.hpp"

namespace tilemerge::core {

inline constexpr int kMinBoardSize = 2;
inline constexpr int kMaxBoardSize = 8;

struct GameConfig {
    std::array<int, 2> window{{500, 500}};
    bool vsync = true;
    // 0 picks a nondeterministic seed.
    std::uint32_t seed = 0;
    SessionRules session{};

    // Clamps every field into a playable range.
    void EnsureConstraints();

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace tilemerge::core
