#pragma once

#include <SDL2/SDL.h>

#include <vector>

#include "tilemerge/platform/InputEvents.hpp"

namespace tilemerge::platform {

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    SdlInput(const SdlInput&) = delete;
    SdlInput& operator=(const SdlInput&) = delete;

    bool Initialize();
    void Shutdown();
    std::vector<InputEvent> Poll();

private:
    struct ControllerEntry {
        SDL_JoystickID instance_id = -1;
        SDL_GameController* controller = nullptr;
    };

    void OpenController(int joystick_index);
    void CloseController(SDL_JoystickID instance_id);

    bool initialized_ = false;
    std::vector<ControllerEntry> controllers_;
};

}  // namespace tilemerge::platform
