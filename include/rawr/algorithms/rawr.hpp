#pragma once

#include <memory>
#include <span>
#include <vector>

#include "rawr/algorithms/beam.hpp"
#include "rawr/common/types.hpp"
#include "rawr/model/backend.hpp"
#include "rawr/saliency/saliency.hpp"

namespace rawr::cands {
class SearchStatsCollection;
} // namespace rawr::cands

namespace rawr::algorithms {

// A prediction-preserving reduction of one example
struct Reduction {
    Sequence tokens;
    PositionList removed_indices;
};

/**
 * @brief Shortest prediction-preserving reductions found for one example.
 *
 * Seeded with the original sequence itself, so an example that cannot be
 * reduced reports the original with no removed positions.
 */
class ExampleResult {
public:
    ExampleResult(const Sequence& original, LabelType original_prediction);

    // Record a beam whose prediction matches the original. Returns true if
    // the beam became (or joined) the best result set.
    bool record(const Beam& beam);

    [[nodiscard]] LabelType get_original_prediction() const noexcept {
        return m_original_prediction;
    }
    [[nodiscard]] SizeType get_original_length() const noexcept {
        return m_original_length;
    }
    [[nodiscard]] SizeType get_best_length() const noexcept {
        return m_best_length;
    }
    [[nodiscard]] const std::vector<Reduction>& get_reductions() const noexcept {
        return m_reductions;
    }

private:
    LabelType m_original_prediction;
    SizeType m_original_length;
    SizeType m_best_length;
    std::vector<Reduction> m_reductions;
};

/**
 * @brief Beam search for the shortest sub-sequences that keep the model's
 * prediction.
 *
 * Every round deletes one token per child beam (see BeamExpander), runs one
 * batched greedy prediction over all children, records those that keep the
 * original label and continues from them. An example terminates when none of
 * its children keeps the label or only the terminator is left; the search
 * ends when all examples are terminated.
 */
class RawrSearch {
public:
    RawrSearch(model::ModelBackend& model,
               saliency::SaliencyScorer& scorer,
               SizeType max_beam_size = kDefaultMaxBeamSize);

    ~RawrSearch();
    RawrSearch(RawrSearch&&) noexcept;
    RawrSearch& operator=(RawrSearch&&) noexcept;
    RawrSearch(const RawrSearch&)            = delete;
    RawrSearch& operator=(const RawrSearch&) = delete;

    [[nodiscard]] std::vector<ExampleResult>
    execute(std::span<const Sequence> xs);

    [[nodiscard]] SizeType get_max_beam_size() const noexcept;
    // Per-round statistics and phase timers of the last execute() call
    [[nodiscard]] const cands::SearchStatsCollection& get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Run the search with gradient-times-input saliency from the same model
[[nodiscard]] std::vector<ExampleResult>
get_rawr(model::ModelBackend& model,
         std::span<const Sequence> xs,
         SizeType max_beam_size = kDefaultMaxBeamSize);

} // namespace rawr::algorithms
