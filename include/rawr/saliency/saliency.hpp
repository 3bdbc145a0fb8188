#pragma once

#include <span>
#include <vector>

#include "rawr/common/types.hpp"
#include "rawr/model/backend.hpp"

namespace rawr::saliency {

// One score per token, for each sequence of a batch
using TokenScores = std::vector<std::vector<float>>;

/**
 * @brief Per-token importance estimator used to rank deletion candidates.
 *
 * Lower scores mark tokens whose removal is expected to change the
 * prediction the least.
 */
class SaliencyScorer {
public:
    SaliencyScorer()                                 = default;
    virtual ~SaliencyScorer()                        = default;
    SaliencyScorer(const SaliencyScorer&)            = delete;
    SaliencyScorer& operator=(const SaliencyScorer&) = delete;
    SaliencyScorer(SaliencyScorer&&)                 = delete;
    SaliencyScorer& operator=(SaliencyScorer&&)      = delete;

    /**
     * @brief Score every token of every sequence in @p xs.
     *
     * @param xs Batch of non-empty sequences.
     * @param ys Target label per sequence. When empty, the model's own greedy
     *           prediction is used as the target.
     * @return Scores with `result[i].size() == xs[i].size()`.
     */
    [[nodiscard]] virtual TokenScores
    score(std::span<const Sequence> xs,
          std::span<const LabelType> ys = {}) = 0;
};

/**
 * @brief Gradient-times-input saliency.
 *
 * The score of token l is <e_l, dL/de_l>, the first-order Taylor estimate of
 * the loss change when the embedding e_l is zeroed out.
 */
class GradientSaliency final : public SaliencyScorer {
public:
    explicit GradientSaliency(model::ModelBackend& model) : m_model(model) {}

    [[nodiscard]] TokenScores
    score(std::span<const Sequence> xs,
          std::span<const LabelType> ys = {}) override;

private:
    model::ModelBackend& m_model;
};

// Row-wise dot product of embeddings and their gradients, shape (seq_len)
[[nodiscard]] std::vector<float>
onehot_grad(const model::EmbeddingType& embedding,
            const model::EmbeddingType& grad);

} // namespace rawr::saliency
