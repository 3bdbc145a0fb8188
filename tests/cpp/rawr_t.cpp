#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "rawr/algorithms/beam.hpp"
#include "rawr/algorithms/rawr.hpp"
#include "rawr/cands.hpp"
#include "rawr/exceptions.hpp"
#include "test_models.hpp"

using rawr::LabelType;
using rawr::PositionList;
using rawr::Sequence;
using rawr::SizeType;
using rawr::algorithms::Beam;
using rawr::algorithms::ExampleResult;
using rawr::algorithms::RawrSearch;
using rawr::testing::RuleModel;
using rawr::testing::TableScorer;

namespace {

bool contains(const Sequence& x, rawr::TokenId token) {
    return std::ranges::find(x, token) != x.end();
}

} // namespace

TEST_CASE("ExampleResult", "[rawr]") {
    const Sequence original = {4, 17, 9, 2};
    ExampleResult result(original, 1);
    REQUIRE(result.get_best_length() == 4);
    REQUIRE(result.get_reductions().size() == 1);
    REQUIRE(result.get_reductions()[0].tokens == original);
    REQUIRE(result.get_reductions()[0].removed_indices.empty());

    const auto beam = Beam::from_sequence(original);
    SECTION("Shorter reduction replaces the result set") {
        REQUIRE(result.record(beam.remove(2)));
        REQUIRE(result.get_best_length() == 3);
        REQUIRE(result.get_reductions().size() == 1);
        REQUIRE(result.get_reductions()[0].removed_indices ==
                PositionList{2});
    }
    SECTION("Ties are appended once") {
        REQUIRE(result.record(beam.remove(2)));
        REQUIRE(result.record(beam.remove(1)));
        REQUIRE_FALSE(result.record(beam.remove(1)));
        REQUIRE(result.get_reductions().size() == 2);
    }
    SECTION("Longer reductions are ignored") {
        REQUIRE(result.record(beam.remove(2).remove(0)));
        REQUIRE_FALSE(result.record(beam.remove(1)));
        REQUIRE(result.get_best_length() == 2);
    }
}

TEST_CASE("RawrSearch scenarios", "[rawr]") {
    TableScorer scorer({{4, 0.9F}, {17, 0.2F}, {9, 0.1F}, {2, 0.0F}});
    const std::vector<Sequence> xs = {{4, 17, 9, 2}};

    SECTION("Removal stops where the prediction flips") {
        // class 1 as long as 17 is present
        RuleModel model([](const Sequence& x) -> LabelType {
            return contains(x, 17) ? 1 : 0;
        });
        RawrSearch search(model, scorer, 1);
        const auto results = search.execute(xs);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].get_original_prediction() == 1);
        REQUIRE(results[0].get_best_length() == 3);
        REQUIRE(results[0].get_reductions().size() == 1);
        REQUIRE(results[0].get_reductions()[0].tokens == Sequence{4, 17, 2});
        REQUIRE(results[0].get_reductions()[0].removed_indices ==
                PositionList{2});

        const auto& stats = search.get_stats();
        REQUIRE(stats.get_nrounds() == 2);
        REQUIRE(stats.get_stats_list()[0].n_survivors == 1);
        REQUIRE(stats.get_stats_list()[1].n_preserved == 0);
    }
    SECTION("Every removal flips the prediction") {
        RuleModel model([](const Sequence& x) -> LabelType {
            return x.size() >= 4 ? 1 : 0;
        });
        const auto results = RawrSearch(model, scorer, 5).execute(xs);
        REQUIRE(results[0].get_best_length() == 4);
        REQUIRE(results[0].get_reductions().size() == 1);
        REQUIRE(results[0].get_reductions()[0].tokens == xs[0]);
        REQUIRE(results[0].get_reductions()[0].removed_indices.empty());
    }
    SECTION("Constant prediction reduces to the terminator") {
        RuleModel model([](const Sequence&) -> LabelType { return 0; });
        const auto results = RawrSearch(model, scorer, 5).execute(xs);
        REQUIRE(results[0].get_best_length() == 1);
        REQUIRE(results[0].get_reductions().size() == 1);
        REQUIRE(results[0].get_reductions()[0].tokens == Sequence{2});
        auto removed = results[0].get_reductions()[0].removed_indices;
        std::ranges::sort(removed);
        REQUIRE(removed == PositionList{0, 1, 2});
    }
    SECTION("Terminator-only input is returned unchanged") {
        RuleModel model([](const Sequence&) -> LabelType { return 0; });
        const std::vector<Sequence> eos_only = {{2}};
        const auto results = RawrSearch(model, scorer, 5).execute(eos_only);
        REQUIRE(results[0].get_reductions()[0].tokens == Sequence{2});
        REQUIRE(results[0].get_reductions()[0].removed_indices.empty());
    }
    SECTION("Empty batch and empty sequences") {
        RuleModel model([](const Sequence&) -> LabelType { return 0; });
        RawrSearch search(model, scorer, 5);
        REQUIRE(search.execute(std::vector<Sequence>{}).empty());
        const std::vector<Sequence> bad = {{1, 2}, {}};
        REQUIRE_THROWS_AS(search.execute(bad),
                          rawr::error_check::DetailedException);
    }
}

TEST_CASE("RawrSearch keeps equal-length reductions", "[rawr]") {
    // equal saliency everywhere, so beams expand leftmost positions first
    TableScorer scorer(std::map<rawr::TokenId, float>{});
    RuleModel model([](const Sequence& x) -> LabelType {
        return contains(x, 8) && x.size() >= 3 ? 1 : 0;
    });
    const std::vector<Sequence> xs = {{5, 6, 7, 8, 2}};
    RawrSearch search(model, scorer, 2);
    const auto results = search.execute(xs);

    const auto& rounds = search.get_stats().get_stats_list();
    REQUIRE(rounds.size() >= 3);
    // {6, 7, 8, 2} and {5, 7, 8, 2} tie after the first round
    REQUIRE(rounds[0].n_preserved == 2);
    REQUIRE(rounds[0].n_results == 2);
    // replaced by the two length-3 children of the first beam
    REQUIRE(rounds[1].n_preserved == 2);
    REQUIRE(rounds[1].n_results == 2);
    REQUIRE(rounds[2].n_preserved == 0);

    const auto& reductions = results[0].get_reductions();
    REQUIRE(results[0].get_best_length() == 3);
    REQUIRE(reductions.size() == 2);
    REQUIRE(reductions[0].tokens == Sequence{7, 8, 2});
    REQUIRE(reductions[0].removed_indices == PositionList{0, 1});
    REQUIRE(reductions[1].tokens == Sequence{6, 8, 2});
    REQUIRE(reductions[1].removed_indices == PositionList{0, 2});
}

TEST_CASE("RawrSearch one model call per round", "[rawr]") {
    TableScorer scorer(std::map<rawr::TokenId, float>{});
    RuleModel model([](const Sequence& x) -> LabelType {
        return contains(x, 3) ? 1 : 0;
    });
    const std::vector<Sequence> xs = {{1, 3, 5, 2}, {3, 2}, {7, 8, 2}};
    RawrSearch search(model, scorer, 3);
    const auto results = search.execute(xs);
    const auto nrounds = search.get_stats().get_nrounds();
    // initial prediction plus one batched call per round with candidates
    REQUIRE(model.get_npredict() <= nrounds + 1);
    REQUIRE(scorer.get_ncalls() == nrounds);
    REQUIRE(results[0].get_best_length() == 2);
    REQUIRE(results[0].get_reductions()[0].tokens == Sequence{3, 2});
    REQUIRE(results[1].get_best_length() == 2);
    REQUIRE(results[2].get_best_length() == 1);
}

TEST_CASE("get_rawr properties", "[rawr]") {
    std::mt19937 gen(1234); // NOLINT
    constexpr SizeType kVocab = 40;
    auto model = rawr::testing::make_random_classifier(kVocab, 8, 3, gen);
    const auto xs =
        rawr::testing::make_random_sequences(24, 1, 9, kVocab, gen);
    const auto ys_0 = model.predict(xs);

    const SizeType max_beam_size = GENERATE(1U, 3U, 5U);
    rawr::saliency::GradientSaliency scorer(model);
    RawrSearch search(model, scorer, max_beam_size);
    const auto results = search.execute(xs);
    REQUIRE(results.size() == xs.size());

    for (SizeType i = 0; i < xs.size(); ++i) {
        const auto& x      = xs[i];
        const auto& result = results[i];
        REQUIRE(result.get_original_prediction() == ys_0[i]);
        REQUIRE(result.get_best_length() <= x.size());
        REQUIRE_FALSE(result.get_reductions().empty());

        std::set<Sequence> unique;
        for (const auto& reduction : result.get_reductions()) {
            // ties only, terminator kept
            REQUIRE(reduction.tokens.size() == result.get_best_length());
            REQUIRE(reduction.tokens.back() == x.back());
            unique.insert(reduction.tokens);

            // removed and remaining positions partition the original
            PositionList removed = reduction.removed_indices;
            std::ranges::sort(removed);
            REQUIRE(std::ranges::adjacent_find(removed) == removed.end());
            REQUIRE(removed.size() + reduction.tokens.size() == x.size());
            Sequence remaining;
            for (SizeType pos = 0; pos < x.size(); ++pos) {
                if (!std::ranges::binary_search(removed, pos)) {
                    remaining.push_back(x[pos]);
                }
            }
            REQUIRE(remaining == reduction.tokens);
        }
        REQUIRE(unique.size() == result.get_reductions().size());

        std::vector<Sequence> reduced;
        for (const auto& reduction : result.get_reductions()) {
            reduced.push_back(reduction.tokens);
        }
        for (const auto y : model.predict(reduced)) {
            REQUIRE(y == ys_0[i]);
        }
    }

    const auto max_len = std::ranges::max(
        xs, {}, [](const auto& x) { return x.size(); }).size();
    SizeType productive = 0;
    for (const auto& stats : search.get_stats().get_stats_list()) {
        REQUIRE(stats.n_beams <= max_beam_size * xs.size());
        if (stats.n_preserved > 0) {
            ++productive;
        }
    }
    REQUIRE(productive <= max_len - 1);
}
