#include "debug_overlay.h"
#include <string>
#include <vector>

static bool g_debug_overlay_visible = false;

void DrawDebugInfo(SDL_Renderer* renderer, TTF_Font* font, const taptiles::Snapshot& snap) {
    if (!renderer || !g_debug_overlay_visible) return;

    std::vector<std::string> lines;
    lines.push_back("speed lvl " + std::to_string(snap.run.speed_level));
    lines.push_back("spawn lane " + std::to_string(snap.run.active_lane));
    lines.push_back("pending " + std::to_string(snap.pending));
    lines.push_back("frames " + std::to_string(snap.frames));

    int line_h = font ? TTF_FontLineSkip(font) : 18;
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 128);
    SDL_Rect r = { 4, 4, 140, static_cast<int>(lines.size()) * line_h + 8 };
    SDL_RenderFillRect(renderer, &r);
    if (!font) return;

    int y = 8;
    for (const auto& text : lines) {
        SDL_Surface* s = TTF_RenderUTF8_Blended(font, text.c_str(), {255,255,255,255});
        if (!s) continue;
        SDL_Texture* t = SDL_CreateTextureFromSurface(renderer, s);
        SDL_Rect dst = { 8, y, s->w, s->h };
        if (t) {
            SDL_RenderCopy(renderer, t, nullptr, &dst);
            SDL_DestroyTexture(t);
        }
        SDL_FreeSurface(s);
        y += line_h;
    }
}

void ToggleDebugOverlay() {
    g_debug_overlay_visible = !g_debug_overlay_visible;
}
