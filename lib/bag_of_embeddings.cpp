#include "rawr/model/bag_of_embeddings.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include <highfive/highfive.hpp>
#include <omp.h>
#include <spdlog/spdlog.h>
#include <xtensor/xbuilder.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xsort.hpp>
#include <xtensor/xview.hpp>

#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"

namespace rawr::model {

namespace {

xt::xtensor<float, 1> softmax(const xt::xtensor<float, 1>& z) {
    const float zmax         = xt::amax(z)();
    xt::xtensor<float, 1> ez = xt::exp(z - zmax);
    const float norm         = xt::sum(ez)();
    return ez / norm;
}

template <SizeType N>
xt::xtensor<float, N> read_dataset(const HighFive::File& file,
                                   const std::string& name) {
    if (!file.exist(name)) {
        throw std::runtime_error(
            std::format("Weights file is missing dataset '{}'", name));
    }
    const auto dataset = file.getDataSet(name);
    const auto dims    = dataset.getDimensions();
    error_check::check_equal(dims.size(), N,
                             std::format("Dataset '{}' has wrong rank", name));
    std::array<SizeType, N> shape{};
    std::ranges::copy(dims, shape.begin());
    auto out = xt::xtensor<float, N>::from_shape(shape);
    dataset.read_raw(out.data());
    return out;
}

} // namespace

BagOfEmbeddingsClassifier::BagOfEmbeddingsClassifier(
    xt::xtensor<float, 2> embed,
    xt::xtensor<float, 2> weight,
    xt::xtensor<float, 1> bias,
    int nthreads)
    : m_embed(std::move(embed)),
      m_weight(std::move(weight)),
      m_bias(std::move(bias)),
      m_nthreads(std::clamp(nthreads, 1, omp_get_max_threads())) {
    validate();
    spdlog::info("BagOfEmbeddingsClassifier: vocab_size={}, embed_dim={}, "
                 "nclasses={}, nthreads={}",
                 get_vocab_size(), get_embed_dim(), get_nclasses(),
                 m_nthreads);
}

std::unique_ptr<BagOfEmbeddingsClassifier>
BagOfEmbeddingsClassifier::from_file(const std::filesystem::path& filepath,
                                     int nthreads) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error(std::format(
            "Model weights file does not exist: {}", filepath.string()));
    }
    HighFive::File file(filepath.string(), HighFive::File::ReadOnly);
    auto embed  = read_dataset<2>(file, "embed");
    auto weight = read_dataset<2>(file, "weight");
    auto bias   = read_dataset<1>(file, "bias");
    spdlog::info("Loaded model weights from {}", filepath.string());
    return std::make_unique<BagOfEmbeddingsClassifier>(
        std::move(embed), std::move(weight), std::move(bias), nthreads);
}

xt::xtensor<float, 1>
BagOfEmbeddingsClassifier::logits(const Sequence& x) const {
    error_check::check(!x.empty(), "logits: empty sequence");
    check_tokens(x);
    return forward(x);
}

xt::xtensor<float, 1>
BagOfEmbeddingsClassifier::forward(const Sequence& x) const {
    xt::xtensor<float, 1> h = xt::zeros<float>({get_embed_dim()});
    for (const auto token : x) {
        h += xt::row(m_embed, token);
    }
    h /= static_cast<float>(x.size());
    xt::xtensor<float, 1> z = xt::sum(m_weight * h, {1});
    z += m_bias;
    return z;
}

std::vector<LabelType>
BagOfEmbeddingsClassifier::predict(std::span<const Sequence> xs) {
    error_check::check_non_empty_sequences(xs, "predict");
    for (const auto& x : xs) {
        check_tokens(x);
    }
    const auto n = xs.size();
    std::vector<LabelType> ys(n);
#pragma omp parallel for num_threads(m_nthreads)
    for (SizeType i = 0; i < n; ++i) {
        const auto z = forward(xs[i]);
        ys[i]        = static_cast<LabelType>(xt::argmax(z)());
    }
    return ys;
}

std::vector<std::vector<float>>
BagOfEmbeddingsClassifier::predict_proba(std::span<const Sequence> xs) {
    error_check::check_non_empty_sequences(xs, "predict_proba");
    for (const auto& x : xs) {
        check_tokens(x);
    }
    const auto n = xs.size();
    std::vector<std::vector<float>> probs(n);
#pragma omp parallel for num_threads(m_nthreads)
    for (SizeType i = 0; i < n; ++i) {
        const auto p = softmax(forward(xs[i]));
        probs[i].assign(p.begin(), p.end());
    }
    return probs;
}

// Softmax cross-entropy averaged over the batch. With h = mean_l(e_l), every
// embedded token of a sequence receives the same gradient W^T (p - y) / L.
EmbeddingGrads
BagOfEmbeddingsClassifier::embedding_grads(std::span<const Sequence> xs,
                                           std::span<const LabelType> ys) {
    error_check::check_non_empty_sequences(xs, "embedding_grads");
    error_check::check_equal(xs.size(), ys.size(),
                             "embedding_grads: xs and ys size mismatch");
    for (SizeType i = 0; i < xs.size(); ++i) {
        check_tokens(xs[i]);
        error_check::check_range(ys[i], get_nclasses(),
                                 "embedding_grads: target label");
    }
    const auto n         = xs.size();
    const auto embed_dim = get_embed_dim();
    const auto inv_batch = 1.0F / static_cast<float>(n);

    EmbeddingGrads out;
    out.embeddings.resize(n);
    out.grads.resize(n);
    std::vector<float> losses(n, 0.0F);

#pragma omp parallel for num_threads(m_nthreads)
    for (SizeType i = 0; i < n; ++i) {
        const auto& x      = xs[i];
        const auto seq_len = x.size();
        auto embedded      = EmbeddingType::from_shape({seq_len, embed_dim});
        for (SizeType l = 0; l < seq_len; ++l) {
            xt::row(embedded, l) = xt::row(m_embed, x[l]);
        }
        xt::xtensor<float, 1> h = xt::mean(embedded, {0});
        xt::xtensor<float, 1> z = xt::sum(m_weight * h, {1});
        z += m_bias;
        auto dz = softmax(z);
        const auto target = static_cast<SizeType>(ys[i]);
        losses[i]         = -std::log(std::max(dz(target), 1e-30F));
        dz(target) -= 1.0F;

        xt::xtensor<float, 1> dh =
            xt::sum(m_weight * xt::view(dz, xt::all(), xt::newaxis()), {0});
        dh *= inv_batch / static_cast<float>(seq_len);
        out.grads[i]      = xt::broadcast(dh, {seq_len, embed_dim});
        out.embeddings[i] = std::move(embedded);
    }
    out.loss = std::reduce(losses.begin(), losses.end(), 0.0F) * inv_batch;
    return out;
}

void BagOfEmbeddingsClassifier::validate() const {
    error_check::check_greater(get_vocab_size(), 0U,
                               "Embedding table must not be empty");
    error_check::check_greater(get_embed_dim(), 0U,
                               "Embedding dimension must be positive");
    error_check::check_greater(get_nclasses(), 0U,
                               "Classifier must have at least one class");
    error_check::check_equal(m_weight.shape()[1], get_embed_dim(),
                             "weight and embed dimensions differ");
    error_check::check_equal(m_bias.shape()[0], get_nclasses(),
                             "bias and weight class counts differ");
}

void BagOfEmbeddingsClassifier::check_tokens(const Sequence& x) const {
    for (const auto token : x) {
        error_check::check_range(token, get_vocab_size(),
                                 "Token id outside the vocabulary");
    }
}

} // namespace rawr::model
