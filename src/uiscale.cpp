#include "uiscale.h"
#include <algorithm>

namespace ui {

static int g_base_w = 400;
static int g_base_h = 450;

static SDL_Window* g_window = nullptr;
static float g_scale = 1.0f;
static int g_off_x = 0;   // letterbox offset when the window aspect differs
static int g_off_y = 0;
static bool g_fullscreen = false;
static int g_windowed_w = 400;
static int g_windowed_h = 450;

void Init(SDL_Window* window, int base_w, int base_h) {
    g_window = window;
    g_base_w = base_w;
    g_base_h = base_h;
    g_windowed_w = base_w;
    g_windowed_h = base_h;
    if (g_window) {
        int w, h;
        SDL_GetWindowSize(g_window, &w, &h);
        OnWindowResized(w, h);
    }
}

void OnWindowResized(int new_w, int new_h) {
    if (g_window && (new_w == 0 || new_h == 0)) {
        SDL_GetWindowSize(g_window, &new_w, &new_h);
    }
    g_scale = std::min(static_cast<float>(new_w) / g_base_w, static_cast<float>(new_h) / g_base_h);
    if (g_scale <= 0.0f) g_scale = 1.0f;
    g_off_x = (new_w - ScaleInt(g_base_w)) / 2;
    g_off_y = (new_h - ScaleInt(g_base_h)) / 2;
    if (!g_fullscreen) {
        g_windowed_w = new_w;
        g_windowed_h = new_h;
    }
}

// desktop fullscreen keeps the display mode
void ToggleFullscreen() {
    if (!g_window) return;
    Uint32 flags = (g_fullscreen ? 0u : SDL_WINDOW_FULLSCREEN_DESKTOP);
    if (SDL_SetWindowFullscreen(g_window, flags) != 0) return;
    g_fullscreen = !g_fullscreen;
    if (!g_fullscreen) {
        SDL_SetWindowSize(g_window, g_windowed_w, g_windowed_h);
        OnWindowResized(g_windowed_w, g_windowed_h);
    } else {
        int w, h;
        SDL_GetWindowSize(g_window, &w, &h);
        OnWindowResized(w, h);
    }
}

void HandleEvent(const SDL_Event& e) {
    if (!g_window) return;
    if (e.type == SDL_WINDOWEVENT) {
        switch (e.window.event) {
            case SDL_WINDOWEVENT_RESIZED:
            case SDL_WINDOWEVENT_SIZE_CHANGED:
                OnWindowResized(e.window.data1, e.window.data2);
                break;
            default:
                break;
        }
    } else if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_F11 && !e.key.repeat) {
        ToggleFullscreen();
    }
}

int ScaleInt(int v) {
    return static_cast<int>(v * g_scale + 0.5f);
}

SDL_Rect ScaleRect(const SDL_Rect& r) {
    SDL_Rect out;
    out.x = g_off_x + ScaleInt(r.x);
    out.y = g_off_y + ScaleInt(r.y);
    out.w = ScaleInt(r.w);
    out.h = ScaleInt(r.h);
    return out;
}

static SDL_Rect MakeRect(int x, int y, int w, int h) {
    SDL_Rect r;
    r.x = x; r.y = y; r.w = w; r.h = h;
    return r;
}

static const int kScoreH = 100;
static const int kButtonW = 100;
static const int kButtonH = 32;
static const int kButtonGap = 12;

SDL_Rect GetPlayfieldRect() {
    return ScaleRect(MakeRect(0, 0, g_base_w, g_base_h));
}

SDL_Rect GetTileRect(float x, float y, int tile_w, int tile_h) {
    return ScaleRect(MakeRect(static_cast<int>(x), static_cast<int>(y), tile_w, tile_h));
}

// guides sit centered under each lane along the bottom edge
SDL_Rect GetGuideRect(int lane, int lane_w, int guide_w, int guide_h) {
    int x = lane * lane_w + (lane_w - guide_w) / 2;
    int y = g_base_h - guide_h;
    return ScaleRect(MakeRect(x, y, guide_w, guide_h));
}

SDL_Rect GetScoreRect() {
    return ScaleRect(MakeRect(0, 0, g_base_w, kScoreH));
}

SDL_Rect GetMenuRect() {
    return GetPlayfieldRect();
}

// Start and Load stacked above the vertical center, labels go below them
SDL_Rect GetStartButtonRect() {
    int x = (g_base_w - kButtonW) / 2;
    int y = g_base_h / 2 - kButtonH * 2 - kButtonGap;
    return ScaleRect(MakeRect(x, y, kButtonW, kButtonH));
}

SDL_Rect GetLoadButtonRect() {
    int x = (g_base_w - kButtonW) / 2;
    int y = g_base_h / 2 - kButtonH;
    return ScaleRect(MakeRect(x, y, kButtonW, kButtonH));
}

} // namespace ui
