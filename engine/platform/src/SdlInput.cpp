#include "tilemerge/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <array>
#include <utility>

namespace tilemerge::platform {

namespace {

constexpr std::array<std::pair<SDL_Keycode, KeyCode>, 10> kKeyTable{{
    {SDLK_ESCAPE, KeyCode::Escape},
    {SDLK_UP, KeyCode::Up},
    {SDLK_DOWN, KeyCode::Down},
    {SDLK_LEFT, KeyCode::Left},
    {SDLK_RIGHT, KeyCode::Right},
    {SDLK_w, KeyCode::W},
    {SDLK_a, KeyCode::A},
    {SDLK_s, KeyCode::S},
    {SDLK_d, KeyCode::D},
    {SDLK_r, KeyCode::R},
}};

constexpr std::array<std::pair<SDL_GameControllerButton, ControllerButton>, 6> kButtonTable{{
    {SDL_CONTROLLER_BUTTON_X, ControllerButton::X},
    {SDL_CONTROLLER_BUTTON_BACK, ControllerButton::Back},
    {SDL_CONTROLLER_BUTTON_DPAD_UP, ControllerButton::DPadUp},
    {SDL_CONTROLLER_BUTTON_DPAD_DOWN, ControllerButton::DPadDown},
    {SDL_CONTROLLER_BUTTON_DPAD_LEFT, ControllerButton::DPadLeft},
    {SDL_CONTROLLER_BUTTON_DPAD_RIGHT, ControllerButton::DPadRight},
}};

KeyCode TranslateKey(SDL_Keycode key) {
    for (const auto& [sdl_key, code] : kKeyTable) {
        if (sdl_key == key) {
            return code;
        }
    }
    return KeyCode::Unknown;
}

ControllerButton TranslateButton(Uint8 button) {
    for (const auto& [sdl_button, mapped] : kButtonTable) {
        if (static_cast<Uint8>(sdl_button) == button) {
            return mapped;
        }
    }
    return ControllerButton::Unknown;
}

// Fills `out` for the SDL events the game reacts to. Device hot-plug events
// are handled by the caller and never produce an InputEvent.
bool Translate(const SDL_Event& sdl_event, InputEvent& out) {
    switch (sdl_event.type) {
        case SDL_QUIT:
            out.type = InputEventType::Quit;
            return true;
        case SDL_KEYDOWN:
        case SDL_KEYUP:
            out.type = sdl_event.type == SDL_KEYDOWN ? InputEventType::KeyDown : InputEventType::KeyUp;
            out.key = TranslateKey(sdl_event.key.keysym.sym);
            out.repeat = sdl_event.key.repeat != 0;
            return out.key != KeyCode::Unknown;
        case SDL_CONTROLLERBUTTONDOWN:
        case SDL_CONTROLLERBUTTONUP:
            out.type = sdl_event.type == SDL_CONTROLLERBUTTONDOWN ? InputEventType::ControllerButtonDown
                                                                  : InputEventType::ControllerButtonUp;
            out.controller_button = TranslateButton(sdl_event.cbutton.button);
            return out.controller_button != ControllerButton::Unknown;
        default:
            return false;
    }
}

}  // namespace

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    SDL_GameControllerEventState(SDL_ENABLE);
    const int joystick_count = SDL_NumJoysticks();
    if (joystick_count < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_INPUT, "SDL_NumJoysticks failed: %s", SDL_GetError());
        return false;
    }
    for (int index = 0; index < joystick_count; ++index) {
        if (SDL_IsGameController(index)) {
            OpenController(index);
        }
    }
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    while (!controllers_.empty()) {
        CloseController(controllers_.back().instance_id);
    }
    initialized_ = false;
}

void SdlInput::OpenController(int joystick_index) {
    const SDL_JoystickID instance_id = SDL_JoystickGetDeviceInstanceID(joystick_index);
    const bool known = std::any_of(controllers_.begin(), controllers_.end(),
                                   [instance_id](const ControllerEntry& entry) { return entry.instance_id == instance_id; });
    if (known) {
        return;
    }
    SDL_GameController* controller = SDL_GameControllerOpen(joystick_index);
    if (!controller) {
        SDL_LogWarn(SDL_LOG_CATEGORY_INPUT, "Controller %d unavailable: %s", joystick_index, SDL_GetError());
        return;
    }
    const char* name = SDL_GameControllerName(controller);
    SDL_LogInfo(SDL_LOG_CATEGORY_INPUT, "Controller connected: %s", name ? name : "unnamed");
    controllers_.push_back(ControllerEntry{instance_id, controller});
}

void SdlInput::CloseController(SDL_JoystickID instance_id) {
    auto it = std::find_if(controllers_.begin(), controllers_.end(),
                           [instance_id](const ControllerEntry& entry) { return entry.instance_id == instance_id; });
    if (it == controllers_.end()) {
        return;
    }
    if (it->controller) {
        SDL_GameControllerClose(it->controller);
    }
    controllers_.erase(it);
    SDL_LogInfo(SDL_LOG_CATEGORY_INPUT, "Controller %d disconnected", static_cast<int>(instance_id));
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        if (sdl_event.type == SDL_CONTROLLERDEVICEADDED) {
            OpenController(sdl_event.cdevice.which);
            continue;
        }
        if (sdl_event.type == SDL_CONTROLLERDEVICEREMOVED) {
            CloseController(sdl_event.cdevice.which);
            continue;
        }
        InputEvent evt;
        if (Translate(sdl_event, evt)) {
            events.push_back(evt);
        }
    }
    return events;
}

}  // namespace tilemerge::platform
