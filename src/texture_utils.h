#ifndef TAPTILES_TEXTURE_UTILS_H
#define TAPTILES_TEXTURE_UTILS_H

#include <SDL.h>
#include <string>

/// Loads an optional skin image (tile face, background) as a blended RGBA texture.
/// Returns nullptr when the file is missing or unreadable; callers fall back to flat fills.
SDL_Texture* LoadSkinTexture(SDL_Renderer* renderer, const std::string& path);

#endif // TAPTILES_TEXTURE_UTILS_H
