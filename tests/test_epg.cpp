#include <catch2/catch.hpp>
#include "epg.hpp"
#include <string>
#include <vector>

using namespace chanview;
using Catch::Detail::Approx;

static EpgProgram prog(int64_t start, int64_t end, const std::string& title) {
    EpgProgram p;
    p.title = title;
    p.start = start;
    p.end = end;
    return p;
}

static std::vector<EpgProgram> abc() {
    return {prog(100, 200, "A"), prog(200, 300, "B"), prog(300, 400, "C")};
}

// ── EpgProgram ──────────────────────────────────────────────────

TEST_CASE("EpgProgram: progress is the elapsed fraction", "[epg]") {
    auto p = prog(200, 300, "B");
    REQUIRE(p.progress(250) == Approx(0.5f));
    REQUIRE(p.progress(200) == Approx(0.0f));
    REQUIRE(p.progress(275) == Approx(0.75f));
}

TEST_CASE("EpgProgram: progress clamps outside the slot", "[epg]") {
    auto p = prog(200, 300, "B");
    REQUIRE(p.progress(50) == 0.0f);
    REQUIRE(p.progress(1000) == 1.0f);
}

TEST_CASE("EpgProgram: degenerate slot has zero progress", "[epg]") {
    REQUIRE(prog(300, 300, "X").progress(300) == 0.0f);
    REQUIRE(prog(300, 200, "X").progress(250) == 0.0f);
}

TEST_CASE("EpgProgram: airing uses a half-open interval", "[epg]") {
    auto p = prog(200, 300, "B");
    REQUIRE(p.is_airing(200));
    REQUIRE(p.is_airing(299));
    REQUIRE_FALSE(p.is_airing(300));
    REQUIRE_FALSE(p.is_airing(199));
}

TEST_CASE("EpgProgram: HH:MM formatting in UTC", "[epg]") {
    // 2024-01-01 13:05:00 UTC .. 14:30:00 UTC
    auto p = prog(1704114300, 1704119400, "News");
    REQUIRE(p.start_time_hhmm() == "13:05");
    REQUIRE(p.end_time_hhmm() == "14:30");
    REQUIRE(prog(0, 0, "unset").start_time_hhmm().empty());
}

// ── EpgTimeline ─────────────────────────────────────────────────

TEST_CASE("EpgTimeline: current and next in the middle of a slot", "[epg]") {
    EpgTimeline t(abc());

    auto cur = t.current_program(250);
    REQUIRE(cur.has_value());
    REQUIRE(cur->title == "B");

    auto next = t.next_program(250);
    REQUIRE(next.has_value());
    REQUIRE(next->title == "C");

    REQUIRE(t.current_progress(250) == Approx(0.5f));
}

TEST_CASE("EpgTimeline: boundary belongs to the later slot", "[epg]") {
    EpgTimeline t(abc());
    REQUIRE(t.current_program(200)->title == "B");
    REQUIRE(t.next_program(200)->title == "C");
    REQUIRE(t.current_program(100)->title == "A");
}

TEST_CASE("EpgTimeline: before and after the guide", "[epg]") {
    EpgTimeline t(abc());

    REQUIRE_FALSE(t.current_program(50).has_value());
    REQUIRE(t.next_program(50)->title == "A");
    REQUIRE(t.current_progress(50) == 0.0f);

    REQUIRE_FALSE(t.current_program(400).has_value());
    REQUIRE_FALSE(t.next_program(400).has_value());
}

TEST_CASE("EpgTimeline: gap between programs", "[epg]") {
    EpgTimeline t({prog(100, 200, "A"), prog(250, 300, "B")});
    REQUIRE_FALSE(t.current_program(220).has_value());
    REQUIRE(t.next_program(220)->title == "B");
}

TEST_CASE("EpgTimeline: empty guide", "[epg]") {
    EpgTimeline t(std::vector<EpgProgram>{});
    REQUIRE(t.empty());
    REQUIRE_FALSE(t.current_program(0).has_value());
    REQUIRE_FALSE(t.next_program(0).has_value());
    REQUIRE(t.upcoming(0, 5).empty());
    REQUIRE(t.is_sorted());
}

TEST_CASE("EpgTimeline: next_program is nearest even when unsorted", "[epg]") {
    EpgTimeline t({prog(300, 400, "C"), prog(100, 200, "A"), prog(200, 300, "B")});
    REQUIRE_FALSE(t.is_sorted());
    REQUIRE(t.next_program(150)->title == "B");
    REQUIRE(t.current_program(150)->title == "A");
}

TEST_CASE("EpgTimeline: equal starts resolve to the earlier entry", "[epg]") {
    EpgTimeline t({prog(300, 400, "first"), prog(300, 350, "second")});
    REQUIRE(t.next_program(100)->title == "first");
}

TEST_CASE("EpgTimeline: overlapping slots return the first in list order", "[epg]") {
    EpgTimeline t({prog(100, 300, "long"), prog(200, 250, "short")});
    REQUIRE(t.current_program(220)->title == "long");

    EpgTimeline reversed({prog(200, 250, "short"), prog(100, 300, "long")});
    REQUIRE(reversed.current_program(220)->title == "short");
}

TEST_CASE("EpgTimeline: list order is kept as given", "[epg]") {
    EpgTimeline t({prog(300, 400, "C"), prog(100, 200, "A")});
    REQUIRE(t.programs()[0].title == "C");
    REQUIRE(t.size() == 2);
}

TEST_CASE("EpgTimeline: upcoming is nearest first and limited", "[epg]") {
    EpgTimeline t({prog(400, 500, "D"), prog(200, 300, "B"), prog(300, 400, "C"),
                   prog(100, 200, "A")});
    auto up = t.upcoming(150, 2);
    REQUIRE(up.size() == 2);
    REQUIRE(up[0].title == "B");
    REQUIRE(up[1].title == "C");

    REQUIRE(t.upcoming(150, 10).size() == 3);
}

TEST_CASE("EpgTimeline: is_sorted on ordered input", "[epg]") {
    REQUIRE(EpgTimeline(abc()).is_sorted());
}
