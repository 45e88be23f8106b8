#include "menu.h"
#include "uiscale.h"
#include <string>
#include <cmath>

static SDL_Color COL_PANEL = {177,177,177,178};
static SDL_Color COL_BUTTON = {240,240,240,255};
static SDL_Color COL_TEXT = {20,20,20,255};
static SDL_Color COL_HIGHLIGHT = {12,150,170,255};

// draw text centered on (cx, y)
static void DrawTextCentered(SDL_Renderer* r, TTF_Font* f, const std::string& text, SDL_Color c, int cx, int y) {
    if (!f || text.empty()) return;
    SDL_Surface* s = TTF_RenderUTF8_Blended(f, text.c_str(), c);
    if (!s) return;
    SDL_Texture* t = SDL_CreateTextureFromSurface(r, s);
    SDL_Rect dst = { cx - s->w/2, y, s->w, s->h };
    SDL_FreeSurface(s);
    if (!t) return;
    SDL_RenderCopy(r, t, nullptr, &dst);
    SDL_DestroyTexture(t);
}

static void DrawButton(SDL_Renderer* r, TTF_Font* f, const SDL_Rect& rect, const std::string& label, bool hovered, float anim) {
    SDL_SetRenderDrawColor(r, COL_BUTTON.r, COL_BUTTON.g, COL_BUTTON.b, COL_BUTTON.a);
    SDL_RenderFillRect(r, &rect);
    if (hovered) {
        Uint8 a = static_cast<Uint8>(40 + 30 * std::fabs(std::sin(anim * 3.0f)));
        SDL_SetRenderDrawColor(r, COL_HIGHLIGHT.r, COL_HIGHLIGHT.g, COL_HIGHLIGHT.b, a);
        SDL_RenderFillRect(r, &rect);
    }
    SDL_SetRenderDrawColor(r, 90, 90, 90, 255);
    SDL_RenderDrawRect(r, &rect);

    int tw = 0, th = 16;
    if (f) TTF_SizeUTF8(f, label.c_str(), &tw, &th);
    DrawTextCentered(r, f, label, COL_TEXT, rect.x + rect.w/2, rect.y + (rect.h - th)/2);
}

void RenderMenu(SDL_Renderer* renderer, TTF_Font* font, const taptiles::Snapshot& snap, MenuButton hovered, float anim) {
    if (!renderer || !snap.menu_visible) return;

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_Rect panel = ui::GetMenuRect();
    SDL_SetRenderDrawColor(renderer, COL_PANEL.r, COL_PANEL.g, COL_PANEL.b, COL_PANEL.a);
    SDL_RenderFillRect(renderer, &panel);

    SDL_Rect start = ui::GetStartButtonRect();
    SDL_Rect load = ui::GetLoadButtonRect();
    DrawButton(renderer, font, start, "Start", hovered == MenuButton::START, anim);
    DrawButton(renderer, font, load, "Load", hovered == MenuButton::LOAD, anim);

    int cx = panel.x + panel.w/2;
    int y = load.y + load.h + ui::ScaleInt(16);
    std::string hi = "Hiscore: " + std::to_string(snap.run.high_score);
    DrawTextCentered(renderer, font, hi, COL_TEXT, cx, y);
    int line = font ? TTF_FontLineSkip(font) : 20;
    DrawTextCentered(renderer, font, snap.sheet_status, COL_TEXT, cx, y + line + ui::ScaleInt(4));
}

static bool Inside(const SDL_Rect& r, int x, int y) {
    SDL_Point p = { x, y };
    return SDL_PointInRect(&p, &r) == SDL_TRUE;
}

MenuButton MenuButtonAt(int x, int y) {
    if (Inside(ui::GetStartButtonRect(), x, y)) return MenuButton::START;
    if (Inside(ui::GetLoadButtonRect(), x, y)) return MenuButton::LOAD;
    return MenuButton::NONE;
}
