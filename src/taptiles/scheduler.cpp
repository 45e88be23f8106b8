#include "scheduler.h"

namespace taptiles {

TileScheduler::TileScheduler(const TilesOptions &opts, unsigned seed)
    : opts_(opts), speed_(opts.speed_thresholds, opts.speed_moves), rng_(seed) {
    for (int i = 0; i < opts_.lane_count(); ++i) {
        Lane l;
        l.index = i;
        l.key = opts_.keys[i];
        l.y = park_y();
        lanes_.push_back(l);
    }
}

void TileScheduler::reset(){
    for (auto &l : lanes_) {
        l.x = 0.0f;
        l.y = park_y();
    }
    pending_.clear();
    speed_.reset();
    spawn_lane_ = 0;
}

void TileScheduler::try_spawn(int score){
    if (lanes_.empty()) return;
    int next = (spawn_lane_ + 1) % static_cast<int>(lanes_.size());
    Lane &l = lanes_[next];
    // the lane must have scrolled out or been hit before it can carry a new tile
    if (!l.parked(park_y())) return;

    spawn_lane_ = next;
    std::uniform_int_distribution<int> pick(0, static_cast<int>(lanes_.size()) - 1);
    PendingHit hit;
    hit.target = pick(rng_);
    hit.lane = next;
    l.x = static_cast<float>(hit.target * opts_.tile_w);
    pending_.push_back(hit);
    speed_.update(score);
}

TickResult TileScheduler::tick(bool run_active, int score){
    const float bottom = static_cast<float>(opts_.view_h);
    for (size_t i = 0; i < lanes_.size(); ++i) {
        Lane &l = lanes_[i];
        if (!run_active || l.y >= bottom) return TickResult::Missed;

        bool is_spawn = static_cast<int>(i) == spawn_lane_;
        if (!is_spawn && l.parked(park_y())) continue;

        if (is_spawn && (l.y >= 0.0f || pending_.empty())) {
            // spawn lane is fully visible or was already hit: hand over to the next lane.
            // the current lane does not move on this tick
            try_spawn(score);
            continue;
        }
        l.y += static_cast<float>(speed_.pixels_per_tick());
    }
    return TickResult::Continue;
}

void TileScheduler::park(int lane){
    if (lane < 0 || lane >= static_cast<int>(lanes_.size())) return;
    lanes_[lane].y = park_y();
}

PendingHit TileScheduler::pop_pending(){
    PendingHit hit = pending_.front();
    pending_.pop_front();
    return hit;
}

} // namespace taptiles
