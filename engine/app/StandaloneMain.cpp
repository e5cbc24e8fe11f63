#define SDL_MAIN_HANDLED

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_ttf.h>

#include "tilemerge/app/AssetFS.hpp"
#include "tilemerge/core/GameConfig.hpp"
#include "tilemerge/core/GameSession.hpp"
#include "tilemerge/core/Random.hpp"
#include "tilemerge/platform/InputIntents.hpp"
#include "tilemerge/platform/SdlInput.hpp"
#include "tilemerge/render/SceneRenderer.hpp"

using tilemerge::app::AssetPath;
using tilemerge::app::FileExists;
using tilemerge::core::FrameInput;
using tilemerge::core::GameConfig;
using tilemerge::core::GameSession;
using tilemerge::core::MersenneRandom;
using tilemerge::core::PlayState;
using tilemerge::platform::CollectIntents;
using tilemerge::platform::SdlInput;
using tilemerge::render::ComputeUiScale;
using tilemerge::render::DestroyFonts;
using tilemerge::render::DrawScene;
using tilemerge::render::LoadFonts;

namespace {

constexpr const char* kConfigFile = "tilemerge.json";
constexpr const char* kWindowTitle = "TileMerge";
constexpr int kReferenceWindowSize = 500;

GameConfig LoadConfig() {
    const std::filesystem::path path = AssetPath(kConfigFile);
    if (!FileExists(path)) {
        SDL_Log("No %s found, using built-in defaults", kConfigFile);
        return GameConfig{};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unable to open %s, using defaults",
                    path.string().c_str());
        return GameConfig{};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    try {
        GameConfig config = GameConfig::Deserialize(buffer.str());
        SDL_Log("Loaded config from %s", path.string().c_str());
        return config;
    } catch (const std::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring malformed %s: %s",
                    path.string().c_str(), ex.what());
        return GameConfig{};
    }
}

void ApplyWindowIcon(SDL_Window* window) {
    const std::filesystem::path path = AssetPath("icon.png");
    if (!FileExists(path)) {
        return;
    }
    SDL_Surface* icon = IMG_Load(path.string().c_str());
    if (!icon) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load window icon: %s", IMG_GetError());
        return;
    }
    SDL_SetWindowIcon(window, icon);
    SDL_FreeSurface(icon);
}

std::uint32_t ResolveSeed(const GameConfig& config) {
    if (config.seed != 0) {
        SDL_Log("Using fixed seed %u", static_cast<unsigned>(config.seed));
        return config.seed;
    }
    return std::random_device{}();
}

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    const int img_flags = IMG_INIT_PNG;
    const int img_result = IMG_Init(img_flags);
    const bool img_ready = (img_result & img_flags) == img_flags;
    if (!img_ready) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    const GameConfig config = LoadConfig();
    const int window_w = config.window[0];
    const int window_h = config.window[1];

    SDL_Window* window =
        SDL_CreateWindow(kWindowTitle, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, window_w,
                         window_h, SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        TTF_Quit();
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }
    if (img_ready) {
        ApplyWindowIcon(window);
    }

    Uint32 renderer_flags = SDL_RENDERER_ACCELERATED;
    if (config.vsync) {
        renderer_flags |= SDL_RENDERER_PRESENTVSYNC;
    }
    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, renderer_flags);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        TTF_Quit();
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }
    SDL_RenderSetLogicalSize(renderer, window_w, window_h);

    auto fonts = LoadFonts(ComputeUiScale(window_w, window_h, kReferenceWindowSize, kReferenceWindowSize));
    if (!fonts.hud || !fonts.tile || !fonts.banner) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to load required fonts.");
        DestroyFonts(fonts);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        TTF_Quit();
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    SdlInput input;
    if (!input.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SdlInput initialization failed: %s", SDL_GetError());
    }

    MersenneRandom rng(ResolveSeed(config));
    GameSession session(config.session, rng);
    SDL_Log("New %dx%d game", session.board().size(), session.board().size());

    bool running = true;
    Uint64 last_counter = SDL_GetPerformanceCounter();
    const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());

    while (running) {
        const auto intents = CollectIntents(input.Poll());
        if (intents.quit) {
            running = false;
            break;
        }

        Uint64 now = SDL_GetPerformanceCounter();
        const float delta_s = static_cast<float>((now - last_counter) / frequency);
        last_counter = now;

        if (intents.reset) {
            SDL_Log("Reset");
        }
        const PlayState previous_state = session.state();
        FrameInput frame;
        frame.direction = intents.direction;
        frame.reset = intents.reset;
        frame.dt = delta_s;
        if (auto turn = session.AdvanceFrame(frame); turn && turn->moved) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Slide %s: +%u (%u merges)",
                         tilemerge::core::DirectionName(*intents.direction),
                         static_cast<unsigned>(turn->score_delta),
                         static_cast<unsigned>(turn->merges.size()));
        }
        if (session.state() != previous_state) {
            SDL_Log("State: %s, score %u", tilemerge::core::PlayStateName(session.state()),
                    static_cast<unsigned>(session.score()));
        }

        DrawScene(renderer, fonts, window_w, session);
        SDL_RenderPresent(renderer);
        session.PruneParticles();
    }

    input.Shutdown();
    DestroyFonts(fonts);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    TTF_Quit();
    if (img_result != 0) {
        IMG_Quit();
    }
    SDL_Quit();
    return 0;
}
