#include "session.h"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace taptiles {

static unsigned seed_for(const TilesOptions &opts){
    if (opts.fixed_seed) return opts.seed;
    return static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

Session::Session(const TilesOptions &opts)
    : opts_(opts), tiles_(opts, seed_for(opts)), judge_(opts.keys) {}

void Session::restart(){
    run_.score = 0;
    run_.running = true;
    tiles_.reset();
    judge_.reset();
    sync_run_state();
    ticker_.start();
}

void Session::end(){
    bool was_running = run_.running;
    run_.running = false;
    run_.high_score = std::max(run_.high_score, run_.score);
    ticker_.stop();
    if (!was_running) return;

    std::cerr << "[session] run ended, score " << run_.score << " (best " << run_.high_score << ")\n";
    if (on_run_end) on_run_end();
}

void Session::tick(){
    if (!ticker_.active()) return;
    ticker_.count();
    TickResult r = tiles_.tick(run_.running, run_.score);
    sync_run_state();
    if (r == TickResult::Missed) end();
}

Verdict Session::key_down(const std::string &key){
    Verdict v = judge_.key_down(key, run_.running, run_.score, tiles_);
    sync_run_state();
    if (v == Verdict::Mismatch) end();
    return v;
}

void Session::key_up(const std::string &key){
    int note = judge_.key_up(key, run_.running, run_.score, sheet_);
    if (note >= 0 && on_play_note) on_play_note(note);
}

bool Session::load_sheet(const std::vector<uint8_t> &data, const std::string &filename){
    return sheet_.load(data, filename, opts_.note_count).ok;
}

void Session::sync_run_state(){
    run_.speed_level = tiles_.speed_level();
    run_.active_lane = tiles_.spawn_lane();
}

Snapshot Session::snapshot() const {
    Snapshot s;
    s.lanes = tiles_.lanes();
    s.guides = judge_.guides();
    s.run = run_;
    s.pending = tiles_.pending().size();
    s.menu_visible = !run_.running;
    s.sheet_status = sheet_.status_text();
    s.frames = ticker_.frames();
    return s;
}

} // namespace taptiles
