#include "judge.h"
#include "scheduler.h"
#include "sheet.h"

namespace taptiles {

InputJudge::InputJudge(const std::string &keys)
    : keys_(keys), guides_(keys.size(), GuideIndicator::Idle) {}

int InputJudge::lane_for_key(const std::string &key) const {
    if (key.size() != 1) return -1;
    auto pos = keys_.find(key[0]);
    if (pos == std::string::npos) return -1;
    return static_cast<int>(pos);
}

Verdict InputJudge::key_down(const std::string &key, bool run_active, int &score, TileScheduler &tiles){
    // only the leading edge of a physical press counts
    if (held(key)) return Verdict::Ignored;
    active_.insert(key);

    if (!tiles.has_pending()) return Verdict::Ignored;

    int lane = lane_for_key(key);
    if (lane < 0 || !run_active) return Verdict::Ignored;

    guides_[lane] = GuideIndicator::Pressed;

    // the oldest tile must be resolved first, whichever one is lower on screen
    PendingHit hit = tiles.pop_pending();
    if (hit.target != lane) return Verdict::Mismatch;

    tiles.park(hit.lane);
    score++;
    return Verdict::Hit;
}

int InputJudge::key_up(const std::string &key, bool run_active, int score, const NoteSheet &sheet){
    active_.erase(key);

    int lane = lane_for_key(key);
    if (lane < 0 || fail_marked_) return -1;

    if (run_active) {
        guides_[lane] = GuideIndicator::Idle;
    } else {
        guides_[lane] = GuideIndicator::Failed;
        fail_marked_ = true;
    }

    if (!sheet.loaded()) return -1;
    return sheet.note_for_score(score);
}

void InputJudge::reset(){
    active_.clear();
    for (auto &g : guides_) g = GuideIndicator::Idle;
    fail_marked_ = false;
}

} // namespace taptiles
