#pragma once

#include <vector>

namespace taptiles {

// Level for a score: 0 below the first threshold, i+1 inside
// [thresholds[i], thresholds[i+1]), clamped to max_level past the last bracket.
int speed_level_for(int score, const std::vector<int> &thresholds, int max_level);

class SpeedPolicy {
public:
    SpeedPolicy(std::vector<int> thresholds, std::vector<int> moves);

    // recompute from score; the level never drops during a run
    int update(int score);
    void reset() { level_ = 0; }

    int level() const { return level_; }
    int max_level() const;
    int pixels_per_tick() const;

private:
    std::vector<int> thresholds_;
    std::vector<int> moves_;
    int level_ = 0;
};

} // namespace taptiles
