#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "judge.h"
#include "lanes.h"
#include "options.h"
#include "scheduler.h"
#include "sheet.h"

namespace taptiles {

struct RunState {
    bool running = false;
    int score = 0;
    int high_score = 0;
    int speed_level = 0;
    int active_lane = 0;   // current spawn lane
};

// Frame clock the session starts on restart and stops when a run ends.
// The frontend loop only ticks the session while it is active.
class TickSource {
public:
    void start() { active_ = true; frames_ = 0; }
    void stop() { active_ = false; }
    bool active() const { return active_; }
    void count() { frames_++; }
    uint64_t frames() const { return frames_; }

private:
    bool active_ = false;
    uint64_t frames_ = 0;
};

// Everything the renderer needs for one frame, copied out of the session.
struct Snapshot {
    std::vector<Lane> lanes;
    std::vector<GuideIndicator> guides;
    RunState run;
    size_t pending = 0;
    bool menu_visible = true;
    std::string sheet_status;
    uint64_t frames = 0;
};

class Session {
public:
    explicit Session(const TilesOptions &opts = TilesOptions());

    void restart();
    void end();

    // one frame of tile movement; does nothing while the tick source is stopped
    void tick();

    Verdict key_down(const std::string &key);
    void key_up(const std::string &key);

    // failure leaves no sheet loaded; the run is not affected either way
    bool load_sheet(const std::vector<uint8_t> &data, const std::string &filename);

    Snapshot snapshot() const;

    const RunState &run() const { return run_; }
    const TileScheduler &tiles() const { return tiles_; }
    const InputJudge &judge() const { return judge_; }
    const NoteSheet &sheet() const { return sheet_; }
    const TickSource &ticker() const { return ticker_; }
    const TilesOptions &options() const { return opts_; }

    // collaborators
    std::function<void(int)> on_play_note;
    std::function<void()> on_run_end;

private:
    void sync_run_state();

    TilesOptions opts_;
    RunState run_;
    TileScheduler tiles_;
    InputJudge judge_;
    NoteSheet sheet_;
    TickSource ticker_;
};

} // namespace taptiles
