#include <string>

#include <catch2/catch_test_macros.hpp>

#include "rawr/cands.hpp"

using rawr::cands::SearchStats;
using rawr::cands::SearchStatsCollection;
using rawr::cands::TimerStats;

TEST_CASE("SearchStats fractions", "[cands]") {
    const SearchStats stats{.round        = 1,
                            .n_candidates = 3,
                            .n_preserved  = 2,
                            .n_survivors  = 1};
    REQUIRE(stats.preserve_frac() == 0.67);
    REQUIRE(stats.survive_frac() == 0.33);
    REQUIRE(SearchStats{}.preserve_frac() == 0.0);
    REQUIRE(stats.get_summary().find("round:   1") != std::string::npos);
}

TEST_CASE("SearchStatsCollection", "[cands]") {
    TimerStats timers;
    timers["expand"]  = 1.0F;
    timers["predict"] = 3.0F;
    REQUIRE(timers.total() == 4.0F);

    SearchStatsCollection search;
    search.update_stats({.round = 1, .n_beams = 1}, timers);
    search.update_stats({.round = 2, .n_beams = 4}, timers);
    REQUIRE(search.get_nrounds() == 2);
    REQUIRE(search.get_stats(2)->n_beams == 4);
    REQUIRE_FALSE(search.get_stats(3).has_value());
    REQUIRE(search.get_timers().at("predict") == 6.0F);
    const auto summary = search.get_timer_summary();
    REQUIRE(summary.starts_with("Timing breakdown: 8.00s"));
    REQUIRE(summary.find("predict") < summary.find("expand"));
    REQUIRE(SearchStatsCollection{}.get_timer_summary() ==
            "Timing breakdown: 0.00s\n");

    SearchStatsCollection all;
    all.merge(search, 0);
    all.merge(search, 1);
    REQUIRE(all.get_nrounds() == 4);
    REQUIRE(all.get_stats_list()[3].batch == 1);
    REQUIRE(all.get_timers().total() == 16.0F);

    const auto [stats_list, packed] = all.get_packed_data();
    REQUIRE(stats_list.size() == 4);
    REQUIRE(packed.size() == 1);
    REQUIRE(packed[0].predict == 12.0F);

    all.reset();
    REQUIRE(all.get_nrounds() == 0);
    REQUIRE(all.get_timers().total() == 0.0F);
}
