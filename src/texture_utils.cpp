#include "texture_utils.h"
#include <SDL_image.h>
#include <iostream>

SDL_Texture* LoadSkinTexture(SDL_Renderer* renderer, const std::string& path) {
    if (!renderer || path.empty()) return nullptr;

    SDL_Surface* orig = IMG_Load(path.c_str());
    if (!orig) {
        std::cerr << "LoadSkinTexture: " << path << " not loaded: " << IMG_GetError() << "\n";
        return nullptr;
    }

    // RGBA so stretched tiles keep clean edges
    SDL_Surface* conv = SDL_ConvertSurfaceFormat(orig, SDL_PIXELFORMAT_RGBA8888, 0);
    SDL_FreeSurface(orig);
    if (!conv) return nullptr;

    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, conv);
    SDL_FreeSurface(conv);
    if (!tex) return nullptr;

    SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
    return tex;
}
