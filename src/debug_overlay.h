#ifndef TAPTILES_DEBUG_OVERLAY_H
#define TAPTILES_DEBUG_OVERLAY_H

#include <SDL.h>
#include <SDL_ttf.h>

#include "taptiles/session.h"

// engine internals in the top-left corner: speed level, spawn lane, pending hits, frames
void DrawDebugInfo(SDL_Renderer* renderer, TTF_Font* font, const taptiles::Snapshot& snap);

// global toggle so any UI loop can flip the overlay (F8 in the game loop)
void ToggleDebugOverlay();

#endif // TAPTILES_DEBUG_OVERLAY_H
