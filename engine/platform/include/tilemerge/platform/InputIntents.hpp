#pragma once

#include <optional>
#include <vector>

#include "tilemerge/core/Types.hpp"
#include "tilemerge/platform/InputEvents.hpp"

namespace tilemerge::platform {

struct FrameIntents {
    std::optional<tilemerge::core::Direction> direction;
    bool reset = false;
    bool quit = false;
};

// Folds one frame of events into at most one direction, a reset flag and a
// quit flag. Directions fire on release, reset on press. When several
// directions are released in the same frame the winner is Right, then Left,
// then Down, then Up.
FrameIntents CollectIntents(const std::vector<InputEvent>& events);

std::optional<tilemerge::core::Direction> KeyDirection(KeyCode key) noexcept;
std::optional<tilemerge::core::Direction> ButtonDirection(ControllerButton button) noexcept;

}  // namespace tilemerge::platform
