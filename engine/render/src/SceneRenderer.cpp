#include "tilemerge/render/SceneRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

#include "tilemerge/app/AssetFS.hpp"
#include "tilemerge/core/TilePalette.hpp"

namespace tilemerge::render {

using tilemerge::core::Board;
using tilemerge::core::BoardGeometry;
using tilemerge::core::Cell;
using tilemerge::core::CellRect;

namespace {

TTF_Font* LoadFontFromCandidates(const std::vector<std::filesystem::path>& candidates,
                                 int point_size) {
    for (const auto& candidate : candidates) {
        if (!tilemerge::app::FileExists(candidate)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(candidate.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "TTF_OpenFont(%s) failed: %s",
                    candidate.string().c_str(), TTF_GetError());
    }
    return nullptr;
}

int ScaledFontSize(int base_size, float scale) {
    int scaled = static_cast<int>(std::lround(static_cast<double>(base_size) * scale));
    if (scaled <= 0) {
        scaled = base_size;
    }
    return std::max(10, scaled);
}

SDL_Color ToSdl(Color color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

SDL_FRect ToFRect(const CellRect& rect) {
    return SDL_FRect{rect.x, rect.y, rect.w, rect.h};
}

void SetDrawColor(SDL_Renderer* renderer, Color color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

std::pair<int, int> MeasureText(TTF_Font* font, const std::string& text) {
    if (!font || text.empty()) {
        return {0, 0};
    }
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) != 0) {
        return {0, 0};
    }
    return {w, h};
}

// Draws `text` centered on (center_x, center_y).
void RenderTextCentered(SDL_Renderer* renderer,
                        TTF_Font* font,
                        float center_x,
                        float center_y,
                        const std::string& text,
                        SDL_Color color) {
    if (!font || text.empty()) {
        return;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        SDL_FreeSurface(surface);
        return;
    }
    SDL_Rect dst{static_cast<int>(center_x - surface->w * 0.5f),
                 static_cast<int>(center_y - surface->h * 0.5f), surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
}

}  // namespace

float ComputeUiScale(int window_w, int window_h, int logical_w, int logical_h) {
    if (window_w <= 0 || window_h <= 0 || logical_w <= 0 || logical_h <= 0) {
        return 1.0f;
    }
    const float scale_w = static_cast<float>(window_w) / static_cast<float>(logical_w);
    const float scale_h = static_cast<float>(window_h) / static_cast<float>(logical_h);
    return std::clamp(std::min(scale_w, scale_h), 0.6f, 3.0f);
}

Fonts LoadFonts(float scale) {
    std::vector<std::filesystem::path> search_paths = {
        tilemerge::app::AssetPath("fonts/DejaVuSans-Bold.ttf"),
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/Library/Fonts/Arial Bold.ttf",
        "C:/Windows/Fonts/arialbd.ttf",
        "C:/Windows/Fonts/segoeui.ttf",
    };

    Fonts fonts;
    fonts.hud = LoadFontFromCandidates(search_paths, ScaledFontSize(30, scale));
    fonts.tile = LoadFontFromCandidates(search_paths, ScaledFontSize(30, scale));
    fonts.banner = LoadFontFromCandidates(search_paths, ScaledFontSize(50, scale));
    return fonts;
}

void DestroyFonts(Fonts& fonts) {
    if (fonts.hud) {
        TTF_CloseFont(fonts.hud);
        fonts.hud = nullptr;
    }
    if (fonts.tile) {
        TTF_CloseFont(fonts.tile);
        fonts.tile = nullptr;
    }
    if (fonts.banner) {
        TTF_CloseFont(fonts.banner);
        fonts.banner = nullptr;
    }
}

void ClearScene(SDL_Renderer* renderer) {
    SetDrawColor(renderer, kBackgroundColor);
    SDL_RenderClear(renderer);
}

void DrawBoard(SDL_Renderer* renderer,
               const Board& board,
               const BoardGeometry& geometry,
               const Fonts& fonts) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    SDL_FRect outline = ToFRect(geometry.boardRect());
    SetDrawColor(renderer, kBeige);
    SDL_RenderDrawRectF(renderer, &outline);

    const SDL_Color label_color = ToSdl(kBeige);
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            const Cell cell{col, row};
            const auto& tile = board.get(cell);
            SDL_FRect rect = ToFRect(geometry.cellRect(cell));
            if (tile.occupied()) {
                SetDrawColor(renderer, tilemerge::core::TileColor(tile.value));
                SDL_RenderFillRectF(renderer, &rect);
            }
            SetDrawColor(renderer, kBeige);
            SDL_RenderDrawRectF(renderer, &rect);
            if (tile.occupied()) {
                RenderTextCentered(renderer, fonts.tile, rect.x + rect.w * 0.5f, rect.y + rect.h * 0.5f,
                                   std::to_string(tile.value), label_color);
            }
        }
    }
}

void DrawScore(SDL_Renderer* renderer, const Fonts& fonts, int window_w, std::uint32_t score) {
    const std::string text = std::to_string(score);
    const int text_h = MeasureText(fonts.hud, text).second;
    RenderTextCentered(renderer, fonts.hud, window_w * 0.5f, 10.0f + text_h * 0.5f, text, ToSdl(kBeige));
}

void DrawGameOver(SDL_Renderer* renderer, const Fonts& fonts, const BoardGeometry& geometry) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_FRect veil = ToFRect(geometry.boardRect());
    SetDrawColor(renderer, kGameOverVeil);
    SDL_RenderFillRectF(renderer, &veil);

    TTF_Font* font = fonts.banner ? fonts.banner : fonts.hud;
    RenderTextCentered(renderer, font, veil.x + veil.w * 0.5f, veil.y + veil.h * 0.5f, "Game Over",
                       ToSdl(kBeige));
}

void DrawParticles(SDL_Renderer* renderer,
                   const std::vector<tilemerge::core::ParticleSprite>& sprites) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    for (const auto& sprite : sprites) {
        SDL_Rect rect{static_cast<int>(sprite.x), static_cast<int>(sprite.y), sprite.size, sprite.size};
        SDL_SetRenderDrawColor(renderer, sprite.color.r, sprite.color.g, sprite.color.b, sprite.alpha);
        SDL_RenderFillRect(renderer, &rect);
        SDL_SetRenderDrawColor(renderer, 0xff, 0xff, 0xff, sprite.alpha);
        SDL_RenderDrawRect(renderer, &rect);
    }
}

void DrawScene(SDL_Renderer* renderer,
               const Fonts& fonts,
               int window_w,
               const tilemerge::core::GameSession& session) {
    ClearScene(renderer);
    DrawScore(renderer, fonts, window_w, session.score());
    const auto& geometry = session.rules().geometry;
    DrawBoard(renderer, session.board(), geometry, fonts);
    if (session.state() == tilemerge::core::PlayState::GameOver) {
        DrawGameOver(renderer, fonts, geometry);
    }
    DrawParticles(renderer, session.particles().Snapshot());
}

}  // namespace tilemerge::render
