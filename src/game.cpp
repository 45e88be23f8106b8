#include "game.h"
#include "audio.h"
#include "debug_overlay.h"
#include "texture_utils.h"
#include "uiscale.h"
#include <fstream>
#include <iostream>
#include <iterator>

static const SDL_Color COL_TILE = {0,0,0,255};
static const SDL_Color COL_GUIDE_IDLE = {211,211,211,255};   // light gray
static const SDL_Color COL_GUIDE_PRESSED = {128,128,128,255};
static const SDL_Color COL_GUIDE_FAILED = {255,0,0,255};
static const SDL_Color COL_TEXT = {30,30,30,255};

static SDL_Color guide_color(taptiles::GuideIndicator g){
    switch(g){
        case taptiles::GuideIndicator::Pressed: return COL_GUIDE_PRESSED;
        case taptiles::GuideIndicator::Failed: return COL_GUIDE_FAILED;
        case taptiles::GuideIndicator::Idle: break;
    }
    return COL_GUIDE_IDLE;
}

// SDL key names ("D", "F", ...) are the identifiers the session maps to lanes
static std::string key_name(const SDL_Event& ev){
    const char* n = SDL_GetKeyName(ev.key.keysym.sym);
    return n ? std::string(n) : std::string();
}

// file name without directories, for the menu's sheet status
static std::string base_name(const std::string& path){
    auto p = path.find_last_of("/\\");
    if(p == std::string::npos) return path;
    return path.substr(p + 1);
}

Game::Game(const taptiles::TilesOptions& opts) : session(opts) {}

void Game::handle_event(const SDL_Event& ev){
    ui::HandleEvent(ev);
    switch(ev.type){
        case SDL_QUIT:
            quit = true;
            break;
        case SDL_KEYDOWN: {
            SDL_Keycode sym = ev.key.keysym.sym;
            if(sym == SDLK_F8 && !ev.key.repeat){ ToggleDebugOverlay(); break; }
            if(sym == SDLK_ESCAPE){ quit = true; break; }
            if(sym == SDLK_RETURN && !session.run().running){ session.restart(); break; }
            // repeats are passed through; the judge drops them while the key is held
            session.key_down(key_name(ev));
            break;
        }
        case SDL_KEYUP:
            session.key_up(key_name(ev));
            break;
        case SDL_MOUSEMOTION:
            hovered = session.run().running ? MenuButton::NONE : MenuButtonAt(ev.motion.x, ev.motion.y);
            break;
        case SDL_MOUSEBUTTONDOWN:
            if(ev.button.button == SDL_BUTTON_LEFT && !session.run().running)
                click_menu(MenuButtonAt(ev.button.x, ev.button.y));
            break;
        case SDL_DROPFILE:
            if(ev.drop.file){
                load_sheet_file(ev.drop.file);
                SDL_free(ev.drop.file);
            }
            break;
        default:
            break;
    }
}

void Game::click_menu(MenuButton b){
    if(b == MenuButton::START){
        hovered = MenuButton::NONE;
        session.restart();
    } else if(b == MenuButton::LOAD){
        // no native file dialog; sheets arrive through SDL_DROPFILE
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_INFORMATION, "Load sheet",
            "Drop a sheet file onto the window.\nFormat: note numbers separated by single spaces.", win);
    }
}

void Game::load_sheet_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs){
        std::cerr << "Game: cannot open sheet " << path << "\n";
        return;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if(!session.load_sheet(data, base_name(path))){
        std::cerr << "ERROR: Failed to parse sheet!\n";
    }
}

void Game::draw_text(int x, int y, const std::string& text, SDL_Color color, TTF_Font* usefont){
    TTF_Font* f = usefont ? usefont : this->font;
    if(!f || text.empty()) return;
    SDL_Surface* surf = TTF_RenderUTF8_Blended(f, text.c_str(), color);
    if(!surf) return;
    SDL_Texture* tx = SDL_CreateTextureFromSurface(ren, surf);
    SDL_Rect dst{ x - surf->w/2, y - surf->h/2, surf->w, surf->h };
    SDL_FreeSurface(surf);
    if(!tx) return;
    SDL_RenderCopy(ren, tx, nullptr, &dst);
    SDL_DestroyTexture(tx);
}

void Game::render(){
    if(!ren) return;
    const taptiles::TilesOptions& opts = session.options();
    taptiles::Snapshot snap = session.snapshot();

    SDL_SetRenderDrawBlendMode(ren, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(ren, 16, 16, 16, 255);
    SDL_RenderClear(ren);

    SDL_Rect field = ui::GetPlayfieldRect();
    if(background){
        SDL_RenderCopy(ren, background, nullptr, &field);
    } else {
        SDL_SetRenderDrawColor(ren, 255, 255, 255, 255);
        SDL_RenderFillRect(ren, &field);
    }

    // key guides along the bottom, under the tiles
    for(size_t i = 0; i < snap.guides.size() && i < snap.lanes.size(); ++i){
        SDL_Rect g = ui::GetGuideRect(static_cast<int>(i), opts.tile_w, opts.guide_w, opts.guide_h);
        SDL_Color c = guide_color(snap.guides[i]);
        SDL_SetRenderDrawColor(ren, c.r, c.g, c.b, c.a);
        SDL_RenderFillRect(ren, &g);
        draw_text(g.x + g.w/2, g.y + g.h/2, std::string(1, snap.lanes[i].key), COL_TEXT, font);
    }

    SDL_RenderSetClipRect(ren, &field);
    for(const auto& lane : snap.lanes){
        if(lane.parked(-static_cast<float>(opts.tile_h))) continue;
        SDL_Rect r = ui::GetTileRect(lane.x, lane.y, opts.tile_w, opts.tile_h);
        if(tile_tex){
            SDL_RenderCopy(ren, tile_tex, nullptr, &r);
        } else {
            SDL_SetRenderDrawColor(ren, COL_TILE.r, COL_TILE.g, COL_TILE.b, COL_TILE.a);
            SDL_RenderFillRect(ren, &r);
        }
    }
    SDL_RenderSetClipRect(ren, nullptr);

    SDL_Rect score = ui::GetScoreRect();
    draw_text(score.x + score.w/2, score.y + score.h/2, std::to_string(snap.run.score), SDL_Color{200,30,30,255}, score_font);

    RenderMenu(ren, font, snap, hovered, anim);
    DrawDebugInfo(ren, font, snap);

    SDL_RenderPresent(ren);
}

int RunGameSDL(SDL_Window* window, SDL_Renderer* renderer, TTF_Font* font, const std::string& font_path,
               const taptiles::TilesOptions& opts){
    if(!window || !renderer) return -1;
    Game g(opts);
    g.win = window;
    g.ren = renderer;
    g.font = font;

    ui::Init(window, opts.view_w, opts.view_h);

    // large score font; fall back to the label font
    TTF_Font* sf = font_path.empty() ? nullptr : TTF_OpenFont(font_path.c_str(), 48);
    if(!font_path.empty() && !sf)
        std::cerr << "RunGameSDL: score font " << font_path << " failed: " << TTF_GetError() << "\n";
    g.score_font = sf ? sf : font;

    g.tile_tex = LoadSkinTexture(renderer, "assets/tile.png");
    g.background = LoadSkinTexture(renderer, "assets/background.png");

    NotePlayer audio;
    if(audio.init(opts.audio_dir, opts.note_count)){
        g.session.on_play_note = [&audio](int note){ audio.play(note); };
    } else {
        std::cerr << "RunGameSDL: audio disabled\n";
    }
    g.session.on_run_end = [&g](){ g.hovered = MenuButton::NONE; };

    // events first, then one tick: a key event never lands inside a tick
    SDL_Event ev;
    const int target_ms = 16; // ~60fps
    while(!g.quit){
        while(SDL_PollEvent(&ev)){
            g.handle_event(ev);
            if(g.quit) break;
        }
        g.session.tick();
        g.anim += target_ms / 1000.0f;
        g.render();
        SDL_Delay(target_ms);
    }

    g.session.on_play_note = nullptr;
    if(g.score_font && g.score_font != font){ TTF_CloseFont(g.score_font); g.score_font = nullptr; }
    if(g.tile_tex){ SDL_DestroyTexture(g.tile_tex); g.tile_tex = nullptr; }
    if(g.background){ SDL_DestroyTexture(g.background); g.background = nullptr; }
    return 0;
}
