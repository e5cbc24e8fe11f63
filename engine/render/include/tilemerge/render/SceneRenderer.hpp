#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <cstdint>
#include <string>
#include <vector>

#include "tilemerge/core/Board.hpp"
#include "tilemerge/core/BoardGeometry.hpp"
#include "tilemerge/core/GameSession.hpp"
#include "tilemerge/core/Particles.hpp"

namespace tilemerge::render {

using tilemerge::core::Color;

inline constexpr Color kBackgroundColor{0x18, 0x18, 0x18, 255};
inline constexpr Color kBeige{211, 176, 131, 255};
inline constexpr Color kGameOverVeil{64, 64, 128, 196};

struct Fonts {
    TTF_Font* hud = nullptr;
    TTF_Font* tile = nullptr;
    TTF_Font* banner = nullptr;
};

// Ratio of the current window to the configured one, clamped for legibility.
float ComputeUiScale(int window_w, int window_h, int logical_w, int logical_h);

Fonts LoadFonts(float scale);
void DestroyFonts(Fonts& fonts);

void ClearScene(SDL_Renderer* renderer);

void DrawBoard(SDL_Renderer* renderer,
               const tilemerge::core::Board& board,
               const tilemerge::core::BoardGeometry& geometry,
               const Fonts& fonts);
void DrawScore(SDL_Renderer* renderer, const Fonts& fonts, int window_w, std::uint32_t score);
void DrawGameOver(SDL_Renderer* renderer,
                  const Fonts& fonts,
                  const tilemerge::core::BoardGeometry& geometry);
void DrawParticles(SDL_Renderer* renderer,
                   const std::vector<tilemerge::core::ParticleSprite>& sprites);

// Whole frame: background, score, board, banner, particles.
void DrawScene(SDL_Renderer* renderer,
               const Fonts& fonts,
               int window_w,
               const tilemerge::core::GameSession& session);

}  // namespace tilemerge::render
