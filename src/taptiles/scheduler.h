#pragma once

#include <deque>
#include <random>
#include <vector>

#include "lanes.h"
#include "options.h"
#include "speed.h"

namespace taptiles {

enum class TickResult {
    Continue,
    Missed      // a tile passed the bottom, or the run was already over
};

// Owns the lanes and the pending-hit FIFO. Exactly one lane at a time is the
// spawn lane; spawning round-robins through lane indices, while the key a tile
// asks for is drawn at random and may differ from the lane it scrolls in.
class TileScheduler {
public:
    TileScheduler(const TilesOptions &opts, unsigned seed);

    // park every lane, clear the queue and speed. The first tile spawns on the next tick
    void reset();

    // advance one frame. Lanes are checked for misses before they move.
    TickResult tick(bool run_active, int score);

    // put a lane back above the visible area
    void park(int lane);

    bool has_pending() const { return !pending_.empty(); }
    PendingHit pop_pending();
    const std::deque<PendingHit> &pending() const { return pending_; }

    const std::vector<Lane> &lanes() const { return lanes_; }
    int spawn_lane() const { return spawn_lane_; }
    int speed_level() const { return speed_.level(); }
    int pixels_per_tick() const { return speed_.pixels_per_tick(); }
    float park_y() const { return static_cast<float>(-opts_.tile_h); }

private:
    void try_spawn(int score);

    TilesOptions opts_;
    std::vector<Lane> lanes_;
    std::deque<PendingHit> pending_;
    SpeedPolicy speed_;
    std::mt19937 rng_;
    int spawn_lane_ = 0;
};

} // namespace taptiles
