#pragma once

#include <string>
#include <vector>

namespace taptiles {

// Game configuration. The frontend fills one of these before creating a Session.
struct TilesOptions {
    // one lane per character; index order is lane order
    std::string keys = "DFJK";

    int view_w = 400;   // playfield width
    int view_h = 450;   // playfield height (tiles at or below this are missed)

    int tile_w = 100;
    int tile_h = 150;   // also the parked offset (tiles rest at -tile_h)

    int guide_w = 100;  // key guide background under each lane
    int guide_h = 40;

    // score needed to reach each speed level and pixels moved per tick at that level.
    // speeds are a factor of tile_h so consecutive tiles leave no gap
    std::vector<int> speed_thresholds = { 10, 25, 45, 75, 110 };
    std::vector<int> speed_moves = { 2, 3, 5, 10, 15 };

    // number of playable notes; sheet entries must be below this
    int note_count = 24;
    std::string audio_dir = "assets/audio/";

    // fixed_seed makes tile targets reproducible (tests, demos)
    bool fixed_seed = false;
    unsigned seed = 0;

    int lane_count() const { return static_cast<int>(keys.size()); }
};

} // namespace taptiles
