#pragma once

#include <span>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "rawr/common/types.hpp"

namespace rawr::model {

using EmbeddingType = xt::xtensor<float, 2>;

/**
 * @brief Loss and embedded inputs of one batched backward pass.
 *
 * `embeddings[i]` and `grads[i]` have shape (len(xs[i]), embed_dim), where
 * `grads[i]` is d(loss)/d(embeddings[i]).
 */
struct EmbeddingGrads {
    float loss{};
    std::vector<EmbeddingType> embeddings;
    std::vector<EmbeddingType> grads;
};

/**
 * @brief Pre-trained sequence classifier used by the search.
 *
 * Every call is batched over a flat list of sequences and blocks until the
 * whole batch is evaluated. Implementations own their device placement and
 * parallelism; the search never inspects weights.
 */
class ModelBackend {
public:
    ModelBackend()                               = default;
    virtual ~ModelBackend()                      = default;
    ModelBackend(const ModelBackend&)            = delete;
    ModelBackend& operator=(const ModelBackend&) = delete;
    ModelBackend(ModelBackend&&)                 = delete;
    ModelBackend& operator=(ModelBackend&&)      = delete;

    // Greedy (argmax) label per sequence, evaluated without gradients
    [[nodiscard]] virtual std::vector<LabelType>
    predict(std::span<const Sequence> xs) = 0;

    // Softmax class distribution per sequence
    [[nodiscard]] virtual std::vector<std::vector<float>>
    predict_proba(std::span<const Sequence> xs) = 0;

    // Prediction loss against ys and its gradient w.r.t. the embedded inputs
    [[nodiscard]] virtual EmbeddingGrads
    embedding_grads(std::span<const Sequence> xs,
                    std::span<const LabelType> ys) = 0;

    [[nodiscard]] virtual SizeType get_nclasses() const = 0;
};

} // namespace rawr::model
