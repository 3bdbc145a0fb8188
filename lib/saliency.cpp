#include "rawr/saliency/saliency.hpp"

#include <vector>

#include <xtensor/xmath.hpp>

#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"

namespace rawr::saliency {

std::vector<float> onehot_grad(const model::EmbeddingType& embedding,
                               const model::EmbeddingType& grad) {
    error_check::check(embedding.shape() == grad.shape(),
                       "onehot_grad: embedding and gradient shapes differ");
    const xt::xtensor<float, 1> dots = xt::sum(embedding * grad, {1});
    return {dots.begin(), dots.end()};
}

TokenScores GradientSaliency::score(std::span<const Sequence> xs,
                                    std::span<const LabelType> ys) {
    error_check::check(!xs.empty(), "GradientSaliency: empty batch");
    error_check::check_non_empty_sequences(xs, "GradientSaliency");

    std::vector<LabelType> targets;
    if (ys.empty()) {
        targets = m_model.predict(xs);
    } else {
        targets.assign(ys.begin(), ys.end());
    }
    error_check::check_equal(targets.size(), xs.size(),
                             "GradientSaliency: one target per sequence");

    const auto result = m_model.embedding_grads(xs, targets);
    error_check::check_equal(result.embeddings.size(), xs.size(),
                             "GradientSaliency: embedded inputs per batch");
    error_check::check_equal(result.grads.size(), xs.size(),
                             "GradientSaliency: gradients per batch");

    TokenScores scores(xs.size());
    for (SizeType i = 0; i < xs.size(); ++i) {
        error_check::check_equal(result.embeddings[i].shape()[0], xs[i].size(),
                                 "GradientSaliency: embedded sequence length");
        scores[i] = onehot_grad(result.embeddings[i], result.grads[i]);
    }
    return scores;
}

} // namespace rawr::saliency
