#include "rawr/algorithms/beam.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include <spdlog/spdlog.h>

#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"

namespace rawr::algorithms {

// --- Beam ---
Beam Beam::from_sequence(const Sequence& x) {
    Beam beam{.tokens = x, .indices = PositionList(x.size()), .removed = {}};
    std::iota(beam.indices.begin(), beam.indices.end(), SizeType{0});
    return beam;
}

Beam Beam::remove(SizeType pos) const {
    error_check::check_range(pos, tokens.size(), "Beam::remove: position");
    Beam child;
    child.tokens.reserve(tokens.size() - 1);
    child.tokens.insert(child.tokens.end(), tokens.begin(),
                        tokens.begin() + static_cast<IndexType>(pos));
    child.tokens.insert(child.tokens.end(),
                        tokens.begin() + static_cast<IndexType>(pos) + 1,
                        tokens.end());
    child.indices.reserve(indices.size() - 1);
    child.indices.insert(child.indices.end(), indices.begin(),
                         indices.begin() + static_cast<IndexType>(pos));
    child.indices.insert(child.indices.end(),
                         indices.begin() + static_cast<IndexType>(pos) + 1,
                         indices.end());
    child.removed = removed;
    child.removed.push_back(indices[pos]);
    return child;
}

// --- ExampleBeams ---
ExampleBeams::ExampleBeams(std::vector<Beam> beams)
    : m_beams(std::move(beams)),
      m_state(m_beams.empty() ? ExampleState::kTerminated
                              : ExampleState::kActive) {}

void ExampleBeams::terminate() noexcept {
    m_beams.clear();
    m_state = ExampleState::kTerminated;
}

// --- BeamSet ---
BeamSet::BeamSet(std::vector<ExampleBeams> examples)
    : m_examples(std::move(examples)) {}

BeamSet BeamSet::from_sequences(std::span<const Sequence> xs) {
    std::vector<ExampleBeams> examples;
    examples.reserve(xs.size());
    for (const auto& x : xs) {
        examples.emplace_back(std::vector<Beam>{Beam::from_sequence(x)});
    }
    return BeamSet(std::move(examples));
}

std::vector<SizeType> BeamSet::get_nbeams() const {
    std::vector<SizeType> n_beams(m_examples.size());
    std::ranges::transform(m_examples, n_beams.begin(),
                           [](const auto& ex) { return ex.get_nbeams(); });
    return n_beams;
}

SizeType BeamSet::get_nbeams_total() const noexcept {
    SizeType total = 0;
    for (const auto& ex : m_examples) {
        total += ex.get_nbeams();
    }
    return total;
}

SizeType BeamSet::get_nactive() const noexcept {
    return static_cast<SizeType>(std::ranges::count_if(
        m_examples, [](const auto& ex) { return ex.is_active(); }));
}

std::vector<Sequence> BeamSet::flatten() const {
    std::vector<Sequence> xs;
    xs.reserve(get_nbeams_total());
    for (const auto& ex : m_examples) {
        for (const auto& beam : ex.get_beams()) {
            xs.push_back(beam.tokens);
        }
    }
    return xs;
}

// --- Candidate selection ---
std::vector<SizeType> rank_positions(std::span<const float> scores,
                                     SizeType max_candidates) {
    if (scores.size() <= 1) {
        return {};
    }
    // don't remove <eos>
    std::vector<SizeType> order(scores.size() - 1);
    std::iota(order.begin(), order.end(), SizeType{0});
    std::ranges::stable_sort(
        order, [&](SizeType a, SizeType b) { return scores[a] < scores[b]; });
    if (order.size() > max_candidates) {
        order.resize(max_candidates);
    }
    return order;
}

std::vector<RemovalCandidate>
select_candidates(std::vector<RemovalCandidate> pool, SizeType max_candidates) {
    std::ranges::stable_sort(pool, {}, &RemovalCandidate::score);
    if (pool.size() > max_candidates) {
        pool.resize(max_candidates);
    }
    return pool;
}

// --- BeamExpander ---
BeamExpander::BeamExpander(saliency::SaliencyScorer& scorer,
                           SizeType max_beam_size)
    : m_scorer(scorer),
      m_max_beam_size(max_beam_size) {
    error_check::check_greater(m_max_beam_size, 0U,
                               "BeamExpander: max_beam_size must be positive");
}

BeamSet BeamExpander::expand(const BeamSet& beams) const {
    const auto xs = beams.flatten();
    saliency::TokenScores scores;
    if (!xs.empty()) {
        scores = m_scorer.score(xs);
        error_check::check_equal(scores.size(), xs.size(),
                                 "BeamExpander: one score row per beam");
    }

    std::vector<ExampleBeams> children;
    children.reserve(beams.get_nexamples());
    SizeType offset = 0;
    for (const auto& example : beams.get_examples()) {
        if (!example.is_active()) {
            children.emplace_back();
            continue;
        }
        std::vector<RemovalCandidate> pool;
        pool.reserve(example.get_nbeams() * m_max_beam_size);
        for (SizeType ib = 0; ib < example.get_nbeams(); ++ib) {
            const auto& beam_scores = scores[offset + ib];
            error_check::check_equal(beam_scores.size(), example[ib].size(),
                                     "BeamExpander: one score per token");
            for (const auto pos : rank_positions(beam_scores, m_max_beam_size)) {
                pool.push_back({.score    = beam_scores[pos],
                                .beam_idx = ib,
                                .position = pos});
            }
        }
        offset += example.get_nbeams();

        std::vector<Beam> next;
        for (const auto& cand :
             select_candidates(std::move(pool), m_max_beam_size)) {
            next.push_back(example[cand.beam_idx].remove(cand.position));
        }
        children.emplace_back(std::move(next));
    }
    error_check::check_equal(offset, xs.size(),
                             "BeamExpander: beams consumed per round");
    spdlog::debug("BeamExpander: {} beams -> {} children", xs.size(),
                  std::accumulate(children.begin(), children.end(),
                                  SizeType{0}, [](SizeType acc, const auto& ex) {
                                      return acc + ex.get_nbeams();
                                  }));
    return BeamSet(std::move(children));
}

BeamSet remove_one(saliency::SaliencyScorer& scorer,
                   const BeamSet& beams,
                   SizeType max_beam_size) {
    return BeamExpander(scorer, max_beam_size).expand(beams);
}

} // namespace rawr::algorithms
