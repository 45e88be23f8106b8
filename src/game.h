#pragma once

#include <SDL.h>
#include <SDL_ttf.h>
#include <cstdint>
#include <string>
#include <vector>

#include "menu.h"
#include "taptiles/options.h"
#include "taptiles/session.h"

// SDL side of a game: owns the window resources and forwards input to the session.
// Drawing reads only session.snapshot(), never the session's internals.
class Game {
public:
    SDL_Window* win = nullptr;
    SDL_Renderer* ren = nullptr;

    TTF_Font* font = nullptr;        // key labels, menu text
    TTF_Font* score_font = nullptr;  // large score at the top

    // optional skins; flat colors are drawn when missing
    SDL_Texture* tile_tex = nullptr;
    SDL_Texture* background = nullptr;

    taptiles::Session session;

    bool quit = false;
    MenuButton hovered = MenuButton::NONE;
    float anim = 0.0f;

    explicit Game(const taptiles::TilesOptions& opts);

    void handle_event(const SDL_Event& ev);
    void load_sheet_file(const std::string& path);
    void click_menu(MenuButton b);
    void render();

    // text helpers: (x,y) is the center
    void draw_text(int x, int y, const std::string& text, SDL_Color color, TTF_Font* usefont);
};

// Run the game in the given window until it is closed. Returns 0 normally.
// font_path is the file `font` was opened from; the score is drawn from it at a larger size.
int RunGameSDL(SDL_Window* window, SDL_Renderer* renderer, TTF_Font* font, const std::string& font_path,
               const taptiles::TilesOptions& opts);
