#include "tilemerge/platform/InputIntents.hpp"

#include <array>

namespace tilemerge::platform {

using tilemerge::core::Direction;

namespace {

constexpr std::array<Direction, 4> kDirectionPriority{
    {Direction::Right, Direction::Left, Direction::Down, Direction::Up}};

std::size_t Slot(Direction direction) {
    switch (direction) {
        case Direction::Up:
            return 0;
        case Direction::Down:
            return 1;
        case Direction::Left:
            return 2;
        case Direction::Right:
            return 3;
    }
    return 3;
}

}  // namespace

std::optional<Direction> KeyDirection(KeyCode key) noexcept {
    switch (key) {
        case KeyCode::Up:
        case KeyCode::W:
            return Direction::Up;
        case KeyCode::Down:
        case KeyCode::S:
            return Direction::Down;
        case KeyCode::Left:
        case KeyCode::A:
            return Direction::Left;
        case KeyCode::Right:
        case KeyCode::D:
            return Direction::Right;
        default:
            return std::nullopt;
    }
}

std::optional<Direction> ButtonDirection(ControllerButton button) noexcept {
    switch (button) {
        case ControllerButton::DPadUp:
            return Direction::Up;
        case ControllerButton::DPadDown:
            return Direction::Down;
        case ControllerButton::DPadLeft:
            return Direction::Left;
        case ControllerButton::DPadRight:
            return Direction::Right;
        default:
            return std::nullopt;
    }
}

FrameIntents CollectIntents(const std::vector<InputEvent>& events) {
    FrameIntents intents;
    std::array<bool, 4> released{};

    for (const auto& evt : events) {
        switch (evt.type) {
            case InputEventType::Quit:
                intents.quit = true;
                break;
            case InputEventType::KeyDown:
                if (evt.key == KeyCode::R && !evt.repeat) {
                    intents.reset = true;
                } else if (evt.key == KeyCode::Escape) {
                    intents.quit = true;
                }
                break;
            case InputEventType::KeyUp:
                if (auto direction = KeyDirection(evt.key)) {
                    released[Slot(*direction)] = true;
                }
                break;
            case InputEventType::ControllerButtonDown:
                if (evt.controller_button == ControllerButton::X ||
                    evt.controller_button == ControllerButton::Back) {
                    intents.reset = true;
                }
                break;
            case InputEventType::ControllerButtonUp:
                if (auto direction = ButtonDirection(evt.controller_button)) {
                    released[Slot(*direction)] = true;
                }
                break;
            default:
                break;
        }
    }

    for (Direction direction : kDirectionPriority) {
        if (released[Slot(direction)]) {
            intents.direction = direction;
            break;
        }
    }
    return intents;
}

}  // namespace tilemerge::platform
