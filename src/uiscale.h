#ifndef TAPTILES_UISCALE_H
#define TAPTILES_UISCALE_H

#include <SDL.h>

namespace ui {

// base_w/base_h is the logical playfield the layout helpers are written against
void Init(SDL_Window* window, int base_w, int base_h);
void OnWindowResized(int new_w, int new_h);
void ToggleFullscreen();
void HandleEvent(const SDL_Event& e);

int ScaleInt(int v);
SDL_Rect ScaleRect(const SDL_Rect& r);

// layout in window pixels
SDL_Rect GetPlayfieldRect();
SDL_Rect GetTileRect(float x, float y, int tile_w, int tile_h);
SDL_Rect GetGuideRect(int lane, int lane_w, int guide_w, int guide_h);
SDL_Rect GetScoreRect();
SDL_Rect GetMenuRect();
SDL_Rect GetStartButtonRect();
SDL_Rect GetLoadButtonRect();

} // namespace ui

#endif // TAPTILES_UISCALE_H
