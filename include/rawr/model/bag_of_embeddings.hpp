#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "rawr/common/types.hpp"
#include "rawr/model/backend.hpp"

namespace rawr::model {

/**
 * @brief CPU reference classifier: mean of token embeddings followed by a
 * linear softmax layer.
 *
 * logits = weight * mean_i(embed[x_i]) + bias. The weights are loaded, not
 * trained. Batched calls are parallelised over sequences with OpenMP.
 */
class BagOfEmbeddingsClassifier final : public ModelBackend {
public:
    /**
     * @param embed Embedding table, shape (vocab_size, embed_dim)
     * @param weight Output projection, shape (nclasses, embed_dim)
     * @param bias Output bias, shape (nclasses)
     * @param nthreads Number of OpenMP threads for batched calls
     */
    BagOfEmbeddingsClassifier(xt::xtensor<float, 2> embed,
                              xt::xtensor<float, 2> weight,
                              xt::xtensor<float, 1> bias,
                              int nthreads = 1);

    // Load `embed`, `weight` and `bias` datasets from an HDF5 file
    static std::unique_ptr<BagOfEmbeddingsClassifier>
    from_file(const std::filesystem::path& filepath, int nthreads = 1);

    [[nodiscard]] std::vector<LabelType>
    predict(std::span<const Sequence> xs) override;
    [[nodiscard]] std::vector<std::vector<float>>
    predict_proba(std::span<const Sequence> xs) override;
    [[nodiscard]] EmbeddingGrads
    embedding_grads(std::span<const Sequence> xs,
                    std::span<const LabelType> ys) override;

    [[nodiscard]] SizeType get_nclasses() const override {
        return m_weight.shape()[0];
    }
    [[nodiscard]] SizeType get_vocab_size() const { return m_embed.shape()[0]; }
    [[nodiscard]] SizeType get_embed_dim() const { return m_embed.shape()[1]; }
    [[nodiscard]] int get_nthreads() const { return m_nthreads; }

    // Logits of a single sequence, shape (nclasses)
    [[nodiscard]] xt::xtensor<float, 1> logits(const Sequence& x) const;

private:
    xt::xtensor<float, 2> m_embed;
    xt::xtensor<float, 2> m_weight;
    xt::xtensor<float, 1> m_bias;
    int m_nthreads;

    void validate() const;
    void check_tokens(const Sequence& x) const;
    // Unchecked logits, safe to call inside parallel regions
    [[nodiscard]] xt::xtensor<float, 1> forward(const Sequence& x) const;
};

} // namespace rawr::model
