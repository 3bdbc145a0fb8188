#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "rawr/common/types.hpp"
#include "rawr/saliency/saliency.hpp"

namespace rawr::algorithms {

/**
 * @brief One partially reduced sequence tracked during the search.
 *
 * `indices[k]` is the position of `tokens[k]` in the original example, so
 * `removed` always refers to original positions regardless of how many
 * deletions happened before.
 */
struct Beam {
    Sequence tokens;
    PositionList indices;
    PositionList removed;

    // Beam holding the full sequence with nothing removed
    static Beam from_sequence(const Sequence& x);

    [[nodiscard]] SizeType size() const noexcept { return tokens.size(); }
    // Only the terminator is left, nothing can be removed
    [[nodiscard]] bool is_exhausted() const noexcept {
        return tokens.size() <= 1;
    }
    // Child beam with the token at (current) position `pos` deleted
    [[nodiscard]] Beam remove(SizeType pos) const;
};

enum class ExampleState : std::uint8_t { kActive, kTerminated };

/**
 * @brief Live beams of one original example.
 *
 * ACTIVE while at least one beam is live. TERMINATED is absorbing: a
 * terminated example never receives beams again.
 */
class ExampleBeams {
public:
    ExampleBeams() = default;
    explicit ExampleBeams(std::vector<Beam> beams);

    [[nodiscard]] ExampleState get_state() const noexcept { return m_state; }
    [[nodiscard]] bool is_active() const noexcept {
        return m_state == ExampleState::kActive;
    }
    [[nodiscard]] SizeType get_nbeams() const noexcept {
        return m_beams.size();
    }
    [[nodiscard]] const std::vector<Beam>& get_beams() const noexcept {
        return m_beams;
    }
    [[nodiscard]] const Beam& operator[](SizeType i) const {
        return m_beams[i];
    }
    void terminate() noexcept;

private:
    std::vector<Beam> m_beams;
    ExampleState m_state{ExampleState::kTerminated};
};

/**
 * @brief Beams of all examples of a batch for one search round.
 *
 * Beams are kept per example and flattened (example order, then beam order)
 * only when a batched model call needs them.
 */
class BeamSet {
public:
    BeamSet() = default;
    explicit BeamSet(std::vector<ExampleBeams> examples);

    // One beam per input sequence
    static BeamSet from_sequences(std::span<const Sequence> xs);

    [[nodiscard]] SizeType get_nexamples() const noexcept {
        return m_examples.size();
    }
    [[nodiscard]] const ExampleBeams& operator[](SizeType i) const {
        return m_examples[i];
    }
    [[nodiscard]] const std::vector<ExampleBeams>& get_examples() const noexcept {
        return m_examples;
    }
    // Live beams per example (`n_beams`)
    [[nodiscard]] std::vector<SizeType> get_nbeams() const;
    [[nodiscard]] SizeType get_nbeams_total() const noexcept;
    [[nodiscard]] SizeType get_nactive() const noexcept;
    [[nodiscard]] bool is_terminated() const noexcept {
        return get_nactive() == 0;
    }

    // Token sequences of all live beams as one flat batch
    [[nodiscard]] std::vector<Sequence> flatten() const;

private:
    std::vector<ExampleBeams> m_examples;
};

// Deletion of `position` from beam `beam_idx` of one example
struct RemovalCandidate {
    float score;
    SizeType beam_idx;
    SizeType position;
};

/**
 * @brief Rank the removable positions of one beam.
 *
 * The last (terminator) position is never returned. Positions are ordered by
 * ascending score with a stable sort, so equal scores keep ascending position
 * order.
 *
 * @param scores Saliency of every token of the beam.
 * @param max_candidates Maximum number of positions to return.
 * @return At most @p max_candidates positions.
 */
[[nodiscard]] std::vector<SizeType> rank_positions(std::span<const float> scores,
                                                   SizeType max_candidates);

/**
 * @brief Keep the @p max_candidates most removable candidates of one example.
 *
 * The pool is stable-sorted by ascending score, so ties keep pool order
 * (parent beam order, then per-beam rank).
 */
[[nodiscard]] std::vector<RemovalCandidate>
select_candidates(std::vector<RemovalCandidate> pool, SizeType max_candidates);

/**
 * @brief Produces the next round of beams by deleting one token per child.
 *
 * Each beam proposes its `max_beam_size` lowest-saliency positions, then the
 * proposals of all beams of an example compete for `max_beam_size` slots, so
 * the number of live beams per example never exceeds `max_beam_size`.
 */
class BeamExpander {
public:
    BeamExpander(saliency::SaliencyScorer& scorer,
                 SizeType max_beam_size = kDefaultMaxBeamSize);

    [[nodiscard]] BeamSet expand(const BeamSet& beams) const;

    [[nodiscard]] SizeType get_max_beam_size() const noexcept {
        return m_max_beam_size;
    }

private:
    saliency::SaliencyScorer& m_scorer;
    SizeType m_max_beam_size;
};

// Single expansion round with a temporary expander
[[nodiscard]] BeamSet remove_one(saliency::SaliencyScorer& scorer,
                                 const BeamSet& beams,
                                 SizeType max_beam_size = kDefaultMaxBeamSize);

} // namespace rawr::algorithms
