#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>
#include <stdio.h>
#include <filesystem>
#include <vector>
#include <string>
#include "game.h"
#include "taptiles/options.h"

int main(int /*argc*/, char* /*argv*/[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO) != 0) {
        fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }
    if (TTF_Init() != 0) {
        fprintf(stderr, "TTF_Init failed: %s\n", TTF_GetError());
        SDL_Quit();
        return 1;
    }
    // skins are optional, keep going without PNG support
    const int img_flags = IMG_INIT_PNG;
    bool img_ready = (IMG_Init(img_flags) & img_flags) == img_flags;
    if (!img_ready) {
        fprintf(stderr, "IMG_Init failed: %s\n", IMG_GetError());
    }

    taptiles::TilesOptions opts;

    SDL_Window* window = SDL_CreateWindow("Tap Tiles", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          opts.view_w, opts.view_h, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        fprintf(stderr, "CreateWindow failed: %s\n", SDL_GetError());
        if (img_ready) IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        fprintf(stderr, "CreateRenderer failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        if (img_ready) IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    // label font: try a few likely paths and print diagnostics
    const std::vector<std::string> try_paths = {
        "assets/font.ttf",
        "src/assets/font.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
    };
    std::string font_path;
    for (const auto &p : try_paths) {
        if (std::filesystem::exists(p)) { font_path = p; break; }
    }
    TTF_Font* font = nullptr;
    if (font_path.empty()) {
        fprintf(stderr, "Label font not found. Tried:\n");
        for (auto &p : try_paths) fprintf(stderr, "  %s\n", p.c_str());
    } else {
        font = TTF_OpenFont(font_path.c_str(), 18);
        if (!font) fprintf(stderr, "TTF_OpenFont(%s) failed: %s\n", font_path.c_str(), TTF_GetError());
    }

    int rc = RunGameSDL(window, renderer, font, font ? font_path : std::string(), opts);

    if (font) TTF_CloseFont(font);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    if (img_ready) IMG_Quit();
    TTF_Quit();
    SDL_Quit();
    return rc;
}
