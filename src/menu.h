#pragma once
#include <SDL.h>
#include <SDL_ttf.h>

#include "taptiles/session.h"

enum class MenuButton {
    NONE,
    START,
    LOAD
};

// Overlay shown whenever no run is active: Start/Load buttons, high score and sheet status.
// `hovered` gets the highlight; `anim` (seconds accumulator) pulses it.
void RenderMenu(SDL_Renderer* renderer, TTF_Font* font, const taptiles::Snapshot& snap, MenuButton hovered, float anim);

// window coordinates -> button under the cursor
MenuButton MenuButtonAt(int x, int y);
