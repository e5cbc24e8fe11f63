#pragma once

namespace tilemerge::platform {

enum class InputEventType {
    Quit,
    KeyDown,
    KeyUp,
    ControllerButtonDown,
    ControllerButtonUp
};

enum class KeyCode {
    Escape,
    Up,
    Down,
    Left,
    Right,
    W,
    A,
    S,
    D,
    R,
    Unknown
};

enum class ControllerButton {
    X,
    Back,
    DPadUp,
    DPadDown,
    DPadLeft,
    DPadRight,
    Unknown
};

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    KeyCode key = KeyCode::Unknown;
    ControllerButton controller_button = ControllerButton::Unknown;
    // Auto-repeated key down.
    bool repeat = false;
};

}  // namespace tilemerge::platform
