// ==============================================================================
// Input judge: key activation, hit/miss judgment, guide indicators
// ==============================================================================

#include "taptiles/judge.h"
#include "taptiles/scheduler.h"
#include "taptiles/sheet.h"

#include <catch2/catch.hpp>

#include <string>

using namespace taptiles;

namespace {

TilesOptions test_options(unsigned seed = 3) {
    TilesOptions opts;
    opts.fixed_seed = true;
    opts.seed = seed;
    return opts;
}

// scheduler after its first tick, with one tile pending
TileScheduler started(unsigned seed = 3) {
    TilesOptions opts = test_options(seed);
    TileScheduler tiles(opts, seed);
    tiles.reset();
    tiles.tick(true, 0);
    return tiles;
}

std::string key_for(int lane) {
    return std::string(1, std::string("DFJK")[lane]);
}

NoteSheet sheet_of(const std::string &text) {
    NoteSheet sheet;
    sheet.load(std::vector<uint8_t>(text.begin(), text.end()), "t.txt", 24);
    return sheet;
}

} // namespace

TEST_CASE("keys map to lanes in index order", "[judge]") {
    InputJudge judge("DFJK");
    REQUIRE(judge.lane_for_key("D") == 0);
    REQUIRE(judge.lane_for_key("F") == 1);
    REQUIRE(judge.lane_for_key("J") == 2);
    REQUIRE(judge.lane_for_key("K") == 3);
    REQUIRE(judge.lane_for_key("Q") == -1);
    REQUIRE(judge.lane_for_key("DF") == -1);
    REQUIRE(judge.lane_for_key("") == -1);
}

TEST_CASE("pressing the target key scores and parks the tile", "[judge]") {
    TileScheduler tiles = started();
    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;

    PendingHit hit = tiles.pending().front();
    REQUIRE(judge.key_down(key_for(hit.target), true, score, tiles) == Verdict::Hit);
    REQUIRE(score == 1);
    REQUIRE_FALSE(tiles.has_pending());
    REQUIRE(tiles.lanes()[hit.lane].y == Approx(tiles.park_y()));
    REQUIRE(judge.guides()[hit.target] == GuideIndicator::Pressed);
}

TEST_CASE("pressing another lane is a mismatch and consumes the entry", "[judge]") {
    TileScheduler tiles = started();
    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;

    PendingHit hit = tiles.pending().front();
    int wrong = (hit.target + 1) % 4;
    REQUIRE(judge.key_down(key_for(wrong), true, score, tiles) == Verdict::Mismatch);
    REQUIRE(score == 0);
    REQUIRE_FALSE(tiles.has_pending());
}

TEST_CASE("held keys do not fire again until released", "[judge]") {
    TilesOptions opts = test_options();
    TileScheduler tiles(opts, opts.seed);
    tiles.reset();
    // two tiles pending
    for (int i = 0; i < 80; ++i) tiles.tick(true, 0);
    REQUIRE(tiles.pending().size() == 2);

    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;
    std::string key = key_for(tiles.pending().front().target);

    Verdict first = judge.key_down(key, true, score, tiles);
    REQUIRE(first == Verdict::Hit);
    REQUIRE(judge.held(key));

    REQUIRE(judge.key_down(key, true, score, tiles) == Verdict::Ignored);
    REQUIRE(judge.key_down(key, true, score, tiles) == Verdict::Ignored);
    REQUIRE(tiles.pending().size() == 1);
    REQUIRE(score == 1);

    NoteSheet none;
    judge.key_up(key, true, score, none);
    REQUIRE_FALSE(judge.held(key));
    REQUIRE(judge.key_down(key, true, score, tiles) != Verdict::Ignored);
    REQUIRE_FALSE(tiles.has_pending());
}

TEST_CASE("unmapped keys and inactive runs leave the queue alone", "[judge]") {
    TileScheduler tiles = started();
    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;

    REQUIRE(judge.key_down("Q", true, score, tiles) == Verdict::Ignored);
    REQUIRE(judge.held("Q"));
    REQUIRE(tiles.pending().size() == 1);

    REQUIRE(judge.key_down("D", false, score, tiles) == Verdict::Ignored);
    REQUIRE(tiles.pending().size() == 1);
    REQUIRE(score == 0);
}

TEST_CASE("key down with nothing pending only marks the key held", "[judge]") {
    TilesOptions opts = test_options();
    TileScheduler tiles(opts, opts.seed);
    tiles.reset();
    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;

    REQUIRE(judge.key_down("J", true, score, tiles) == Verdict::Ignored);
    REQUIRE(judge.held("J"));
    REQUIRE(judge.guides()[2] == GuideIndicator::Idle);
}

TEST_CASE("release during a run restores the guide and plays the sheet note", "[judge]") {
    TileScheduler tiles = started();
    InputJudge judge("DFJK");
    judge.reset();
    NoteSheet sheet = sheet_of("5 3 8");
    int score = 0;

    std::string key = key_for(tiles.pending().front().target);
    REQUIRE(judge.key_down(key, true, score, tiles) == Verdict::Hit);
    int note = judge.key_up(key, true, score, sheet);
    REQUIRE(note == 5);
    REQUIRE(judge.guides()[judge.lane_for_key(key)] == GuideIndicator::Idle);
}

TEST_CASE("release at score 0 plays the last sheet note (known quirk)", "[judge]") {
    InputJudge judge("DFJK");
    judge.reset();
    NoteSheet sheet = sheet_of("5 3 8");
    REQUIRE(judge.key_up("D", true, 0, sheet) == 8);
}

TEST_CASE("release without a sheet plays nothing", "[judge]") {
    InputJudge judge("DFJK");
    judge.reset();
    NoteSheet none;
    REQUIRE(judge.key_up("F", true, 3, none) == -1);
    REQUIRE(judge.key_up("Q", true, 3, sheet_of("1 2")) == -1);
}

TEST_CASE("first release after a run ends marks the failed lane once", "[judge]") {
    InputJudge judge("DFJK");
    judge.reset();
    NoteSheet sheet = sheet_of("5 3 8");

    REQUIRE(judge.key_up("K", false, 2, sheet) == 3);
    REQUIRE(judge.guides()[3] == GuideIndicator::Failed);
    REQUIRE(judge.fail_marked());

    REQUIRE(judge.key_up("D", false, 2, sheet) == -1);
    REQUIRE(judge.guides()[0] == GuideIndicator::Idle);
}

TEST_CASE("releases before the first run do nothing", "[judge]") {
    InputJudge judge("DFJK");
    NoteSheet sheet = sheet_of("5 3 8");
    REQUIRE(judge.fail_marked());
    REQUIRE(judge.key_up("D", false, 0, sheet) == -1);
    REQUIRE(judge.guides()[0] == GuideIndicator::Idle);
}

TEST_CASE("reset forgets held keys and clears guides", "[judge]") {
    TileScheduler tiles = started();
    InputJudge judge("DFJK");
    judge.reset();
    int score = 0;
    judge.key_down(key_for(tiles.pending().front().target), true, score, tiles);
    judge.key_down("Q", true, score, tiles);
    REQUIRE(judge.held_count() == 2);

    judge.reset();
    REQUIRE(judge.held_count() == 0);
    REQUIRE_FALSE(judge.fail_marked());
    for (auto g : judge.guides()) REQUIRE(g == GuideIndicator::Idle);
}
