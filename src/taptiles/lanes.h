#pragma once

namespace taptiles {

enum class LaneState {
    Idle,        // parked above the visible area
    Descending,
    Past         // reached the bottom without being resolved
};

// Visual feedback under each lane's key label.
enum class GuideIndicator {
    Idle,
    Pressed,
    Failed
};

struct Lane {
    int index = 0;
    char key = 0;
    float x = 0.0f;  // set to the target key's column when a tile spawns
    float y = 0.0f;  // top edge of the tile

    bool parked(float park_y) const { return y <= park_y; }

    LaneState state(float park_y, float view_h) const {
        if (y >= view_h) return LaneState::Past;
        if (parked(park_y)) return LaneState::Idle;
        return LaneState::Descending;
    }
};

// A tile the player still owes a key press for. `target` is the key index that
// must be pressed, `lane` the lane whose tile is reset when it is.
struct PendingHit {
    int target = 0;
    int lane = 0;
};

} // namespace taptiles
