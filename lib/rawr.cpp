#include "rawr/algorithms/rawr.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "rawr/cands.hpp"
#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"
#include "rawr/timing.hpp"

namespace rawr::algorithms {

// --- ExampleResult ---
ExampleResult::ExampleResult(const Sequence& original,
                             LabelType original_prediction)
    : m_original_prediction(original_prediction),
      m_original_length(original.size()),
      m_best_length(original.size()),
      m_reductions{Reduction{.tokens = original, .removed_indices = {}}} {}

bool ExampleResult::record(const Beam& beam) {
    const auto length = beam.size();
    if (length < m_best_length) {
        m_best_length = length;
        m_reductions.clear();
        m_reductions.push_back(
            {.tokens = beam.tokens, .removed_indices = beam.removed});
        return true;
    }
    if (length == m_best_length) {
        const auto seen = std::ranges::any_of(
            m_reductions, [&](const auto& r) { return r.tokens == beam.tokens; });
        if (!seen) {
            m_reductions.push_back(
                {.tokens = beam.tokens, .removed_indices = beam.removed});
            return true;
        }
    }
    return false;
}

// --- RawrSearch ---
class RawrSearch::Impl {
public:
    Impl(model::ModelBackend& model,
         saliency::SaliencyScorer& scorer,
         SizeType max_beam_size)
        : m_model(model),
          m_expander(scorer, max_beam_size) {}

    ~Impl()                      = default;
    Impl(const Impl&)            = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&)                 = delete;
    Impl& operator=(Impl&&)      = delete;

    SizeType get_max_beam_size() const noexcept {
        return m_expander.get_max_beam_size();
    }
    const cands::SearchStatsCollection& get_stats() const noexcept {
        return m_stats;
    }

    std::vector<ExampleResult> execute(std::span<const Sequence> xs) {
        m_stats.reset();
        if (xs.empty()) {
            return {};
        }
        error_check::check_non_empty_sequences(xs, "RawrSearch::execute");

        const auto ys_0 = m_model.predict(xs);
        error_check::check_equal(ys_0.size(), xs.size(),
                                 "RawrSearch: one prediction per input");
        std::vector<ExampleResult> results;
        results.reserve(xs.size());
        for (SizeType i = 0; i < xs.size(); ++i) {
            results.emplace_back(xs[i], ys_0[i]);
        }

        // Every productive round deletes one token from each surviving beam
        const auto max_len = std::ranges::max(
            xs, {}, [](const auto& x) { return x.size(); }).size();
        const auto max_rounds = max_len - 1;

        auto beams     = BeamSet::from_sequences(xs);
        SizeType round = 0;
        while (!beams.is_terminated()) {
            ++round;
            beams = execute_round(beams, ys_0, results, round, max_rounds);
        }
        spdlog::debug("RawrSearch: {} examples finished after {} rounds",
                      xs.size(), round);
        return results;
    }

private:
    model::ModelBackend& m_model;
    BeamExpander m_expander;
    cands::SearchStatsCollection m_stats;

    BeamSet execute_round(const BeamSet& beams,
                          std::span<const LabelType> ys_0,
                          std::vector<ExampleResult>& results,
                          SizeType round,
                          SizeType max_rounds) {
        cands::TimerStats timers;
        timing::SimpleTimer timer;
        cands::SearchStats stats{.round    = round,
                                 .n_active = beams.get_nactive(),
                                 .n_beams  = beams.get_nbeams_total()};

        timer.start();
        const auto candidates = m_expander.expand(beams);
        const auto xs         = candidates.flatten();
        timers["expand"] += timer.stop();
        stats.n_candidates = xs.size();
        if (xs.empty()) {
            m_stats.update_stats(stats, timers);
            return candidates;
        }
        error_check::check_less_equal(
            round, max_rounds, "RawrSearch: exceeded the maximum round count");

        timer.start();
        const auto ys = m_model.predict(xs);
        timers["predict"] += timer.stop();
        // sum(n_beams) == len(xs) == len(ys)
        error_check::check_equal(ys.size(), candidates.get_nbeams_total(),
                                 "RawrSearch: one prediction per candidate");

        timer.start();
        std::vector<ExampleBeams> survivors;
        survivors.reserve(candidates.get_nexamples());
        SizeType offset = 0;
        for (SizeType ie = 0; ie < candidates.get_nexamples(); ++ie) {
            const auto& example = candidates[ie];
            std::vector<Beam> next;
            for (const auto& beam : example.get_beams()) {
                const auto y = ys[offset++];
                if (y != ys_0[ie]) {
                    continue;
                }
                ++stats.n_preserved;
                results[ie].record(beam);
                if (beam.is_exhausted()) {
                    continue;
                }
                next.push_back(beam);
            }
            survivors.emplace_back(std::move(next));
        }
        BeamSet next_beams(std::move(survivors));
        timers["record"] += timer.stop();

        stats.n_survivors = next_beams.get_nbeams_total();
        for (const auto& result : results) {
            stats.n_results += result.get_reductions().size();
        }
        spdlog::debug("{}", stats.get_summary());
        m_stats.update_stats(stats, timers);
        return next_beams;
    }
};

RawrSearch::RawrSearch(model::ModelBackend& model,
                       saliency::SaliencyScorer& scorer,
                       SizeType max_beam_size)
    : m_impl(std::make_unique<Impl>(model, scorer, max_beam_size)) {}
RawrSearch::~RawrSearch()                                      = default;
RawrSearch::RawrSearch(RawrSearch&& other) noexcept            = default;
RawrSearch& RawrSearch::operator=(RawrSearch&& other) noexcept = default;

std::vector<ExampleResult> RawrSearch::execute(std::span<const Sequence> xs) {
    return m_impl->execute(xs);
}
SizeType RawrSearch::get_max_beam_size() const noexcept {
    return m_impl->get_max_beam_size();
}
const cands::SearchStatsCollection& RawrSearch::get_stats() const {
    return m_impl->get_stats();
}

std::vector<ExampleResult> get_rawr(model::ModelBackend& model,
                                    std::span<const Sequence> xs,
                                    SizeType max_beam_size) {
    saliency::GradientSaliency scorer(model);
    RawrSearch search(model, scorer, max_beam_size);
    return search.execute(xs);
}

} // namespace rawr::algorithms
