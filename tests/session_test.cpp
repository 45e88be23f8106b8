// ==============================================================================
// Session controller: restart/end lifecycle and end-to-end scenarios
// ==============================================================================

#include "taptiles/session.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace taptiles;

namespace {

TilesOptions seeded(unsigned seed) {
    TilesOptions opts;
    opts.fixed_seed = true;
    opts.seed = seed;
    return opts;
}

// seed whose first tile asks for `target`
unsigned seed_for_first_target(int target) {
    for (unsigned seed = 0; seed < 500; ++seed) {
        Session s(seeded(seed));
        s.restart();
        s.tick();
        if (s.tiles().pending().front().target == target) return seed;
    }
    FAIL("no seed produces target " << target);
    return 0;
}

std::string key_for(int lane) {
    return std::string(1, std::string("DFJK")[lane]);
}

std::vector<uint8_t> bytes(const std::string &s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("new session waits in the menu", "[session]") {
    Session s(seeded(1));
    REQUIRE_FALSE(s.run().running);
    REQUIRE_FALSE(s.ticker().active());

    s.tick();
    REQUIRE(s.ticker().frames() == 0);
    REQUIRE_FALSE(s.tiles().has_pending());

    Snapshot snap = s.snapshot();
    REQUIRE(snap.menu_visible);
    REQUIRE(snap.sheet_status == "No sheet loaded");
    REQUIRE(snap.lanes.size() == 4);
}

TEST_CASE("restart resets the run", "[session]") {
    Session s(seeded(1));
    s.restart();
    for (int i = 0; i < 90; ++i) s.tick();
    s.key_down("Q");
    s.key_down(key_for(s.tiles().pending().front().target));

    s.restart();
    REQUIRE(s.run().running);
    REQUIRE(s.run().score == 0);
    REQUIRE(s.run().speed_level == 0);
    REQUIRE_FALSE(s.tiles().has_pending());
    REQUIRE(s.judge().held_count() == 0);
    REQUIRE(s.ticker().active());
    for (const auto &l : s.tiles().lanes()) REQUIRE(l.y == Approx(s.tiles().park_y()));
    for (auto g : s.judge().guides()) REQUIRE(g == GuideIndicator::Idle);
    REQUIRE_FALSE(s.snapshot().menu_visible);
}

TEST_CASE("J hit scores, wrong key then ends the run", "[session]") {
    Session s(seeded(seed_for_first_target(2)));
    int ended = 0;
    s.on_run_end = [&ended]() { ended++; };

    s.restart();
    s.tick();
    REQUIRE(s.tiles().pending().front().target == 2);
    int lane = s.tiles().pending().front().lane;

    REQUIRE(s.key_down("J") == Verdict::Hit);
    REQUIRE(s.run().score == 1);
    REQUIRE(s.tiles().lanes()[lane].y == Approx(s.tiles().park_y()));
    s.key_up("J");

    // next tile
    s.tick();
    REQUIRE(s.tiles().has_pending());
    int target = s.tiles().pending().front().target;
    std::string wrong = key_for((target + 1) % 4);

    REQUIRE(s.key_down(wrong) == Verdict::Mismatch);
    REQUIRE_FALSE(s.run().running);
    REQUIRE(s.run().high_score == 1);
    REQUIRE_FALSE(s.ticker().active());
    REQUIRE(ended == 1);
    REQUIRE(s.snapshot().menu_visible);
}

TEST_CASE("wrong key on the first tile ends with no points", "[session]") {
    Session s(seeded(seed_for_first_target(2)));
    s.restart();
    s.tick();

    REQUIRE(s.key_down("D") == Verdict::Mismatch);
    REQUIRE_FALSE(s.run().running);
    REQUIRE(s.run().high_score == 0);
}

TEST_CASE("a missed tile ends the run and stops ticking", "[session]") {
    Session s(seeded(5));
    int ended = 0;
    s.on_run_end = [&ended]() { ended++; };
    s.restart();

    int ticks = 0;
    while (s.run().running && ticks < 1000) {
        s.tick();
        ticks++;
    }
    REQUIRE_FALSE(s.run().running);
    REQUIRE(ticks == 302);
    REQUIRE(ended == 1);

    uint64_t frames = s.ticker().frames();
    float y = s.tiles().lanes()[1].y;
    s.tick();
    REQUIRE(s.ticker().frames() == frames);
    REQUIRE(s.tiles().lanes()[1].y == Approx(y));
}

TEST_CASE("end is idempotent", "[session]") {
    Session s(seeded(1));
    int ended = 0;
    s.on_run_end = [&ended]() { ended++; };
    s.restart();
    s.tick();
    s.key_down(key_for(s.tiles().pending().front().target));
    REQUIRE(s.run().score == 1);

    s.end();
    s.end();
    REQUIRE(ended == 1);
    REQUIRE(s.run().high_score == 1);

    // a worse run keeps the best score
    s.restart();
    s.end();
    REQUIRE(s.run().high_score == 1);
    REQUIRE(ended == 2);
}

TEST_CASE("release after a hit plays the sheet note", "[session]") {
    Session s(seeded(2));
    std::vector<int> played;
    s.on_play_note = [&played](int n) { played.push_back(n); };

    REQUIRE(s.load_sheet(bytes("5 3 8"), "song.txt"));
    REQUIRE(s.snapshot().sheet_status == "Loaded song.txt");

    s.restart();
    s.tick();
    std::string key = key_for(s.tiles().pending().front().target);
    REQUIRE(s.key_down(key) == Verdict::Hit);
    s.key_up(key);

    REQUIRE(played == std::vector<int>{ 5 });
}

TEST_CASE("failed run shows the failure on one release", "[session]") {
    Session s(seeded(seed_for_first_target(2)));
    std::vector<int> played;
    s.on_play_note = [&played](int n) { played.push_back(n); };
    REQUIRE(s.load_sheet(bytes("5 3 8"), "song.txt"));

    s.restart();
    s.tick();
    s.key_down("K");
    REQUIRE_FALSE(s.run().running);

    s.key_up("K");
    REQUIRE(s.judge().guides()[3] == GuideIndicator::Failed);
    REQUIRE(played == std::vector<int>{ 8 });

    s.key_up("D");
    REQUIRE(s.judge().guides()[0] == GuideIndicator::Idle);
    REQUIRE(played.size() == 1);
}

TEST_CASE("bad sheet clears the old one without touching the run", "[session]") {
    Session s(seeded(2));
    REQUIRE(s.load_sheet(bytes("0 1 2"), "a.txt"));
    s.restart();
    s.tick();

    REQUIRE_FALSE(s.load_sheet(bytes("0 1 99"), "b.txt"));
    REQUIRE_FALSE(s.sheet().loaded());
    REQUIRE(s.snapshot().sheet_status == "No sheet loaded");
    REQUIRE(s.run().running);
    REQUIRE(s.tiles().has_pending());
}

TEST_CASE("sheet survives restarts", "[session]") {
    Session s(seeded(2));
    REQUIRE(s.load_sheet(bytes("4 4"), "a.txt"));
    s.restart();
    s.end();
    s.restart();
    REQUIRE(s.sheet().loaded());
    REQUIRE(s.sheet().notes() == std::vector<int>{ 4, 4 });
}
