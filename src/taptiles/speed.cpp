#include "speed.h"
#include <algorithm>
#include <utility>

namespace taptiles {

int speed_level_for(int score, const std::vector<int> &thresholds, int max_level){
    int level = 0;
    for (int t : thresholds) {
        if (score >= t) level++;
        else break;
    }
    return std::max(0, std::min(level, max_level));
}

SpeedPolicy::SpeedPolicy(std::vector<int> thresholds, std::vector<int> moves)
    : thresholds_(std::move(thresholds)), moves_(std::move(moves)) {
    if (moves_.empty()) moves_.push_back(1);
}

int SpeedPolicy::update(int score){
    level_ = std::max(level_, speed_level_for(score, thresholds_, max_level()));
    return level_;
}

int SpeedPolicy::max_level() const {
    return static_cast<int>(moves_.size()) - 1;
}

int SpeedPolicy::pixels_per_tick() const {
    return moves_[level_];
}

} // namespace taptiles
