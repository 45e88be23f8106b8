#pragma once

#include <set>
#include <string>
#include <vector>

#include "lanes.h"

namespace taptiles {

class TileScheduler;
class NoteSheet;

enum class Verdict {
    Ignored,    // repeat while held, unmapped key, nothing pending or run over
    Hit,
    Mismatch    // wrong lane for the oldest pending tile, ends the run
};

// Matches key presses against the pending-hit FIFO and keeps the key guide state.
class InputJudge {
public:
    explicit InputJudge(const std::string &keys);

    // on Hit the score has already been incremented and the tile parked
    Verdict key_down(const std::string &key, bool run_active, int &score, TileScheduler &tiles);

    // returns the note index to play, or -1
    int key_up(const std::string &key, bool run_active, int score, const NoteSheet &sheet);

    // new run: guides idle, held keys forgotten, failure highlight armed
    void reset();

    int lane_for_key(const std::string &key) const;
    bool held(const std::string &key) const { return active_.count(key) != 0; }
    size_t held_count() const { return active_.size(); }
    bool fail_marked() const { return fail_marked_; }
    const std::vector<GuideIndicator> &guides() const { return guides_; }

private:
    std::string keys_;
    std::set<std::string> active_;
    std::vector<GuideIndicator> guides_;
    // set until the first restart, and again once the failed key has been marked,
    // so only one release after a run ends shows the failure
    bool fail_marked_ = true;
};

} // namespace taptiles
