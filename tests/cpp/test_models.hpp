#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <random>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "rawr/common/types.hpp"
#include "rawr/model/backend.hpp"
#include "rawr/model/bag_of_embeddings.hpp"
#include "rawr/saliency/saliency.hpp"

namespace rawr::testing {

// Classifier whose greedy label is an arbitrary function of the sequence
class RuleModel final : public model::ModelBackend {
public:
    using Rule = std::function<LabelType(const Sequence&)>;

    explicit RuleModel(Rule rule, SizeType nclasses = 2)
        : m_rule(std::move(rule)),
          m_nclasses(nclasses) {}

    std::vector<LabelType> predict(std::span<const Sequence> xs) override {
        ++m_npredict;
        std::vector<LabelType> ys;
        ys.reserve(xs.size());
        for (const auto& x : xs) {
            ys.push_back(m_rule(x));
        }
        return ys;
    }

    std::vector<std::vector<float>>
    predict_proba(std::span<const Sequence> xs) override {
        std::vector<std::vector<float>> probs;
        for (const auto y : predict(xs)) {
            std::vector<float> p(m_nclasses, 0.0F);
            p[static_cast<SizeType>(y)] = 1.0F;
            probs.push_back(std::move(p));
        }
        return probs;
    }

    model::EmbeddingGrads
    embedding_grads(std::span<const Sequence> /*xs*/,
                    std::span<const LabelType> /*ys*/) override {
        throw std::logic_error("RuleModel has no gradients");
    }

    SizeType get_nclasses() const override { return m_nclasses; }
    SizeType get_npredict() const { return m_npredict; }

private:
    Rule m_rule;
    SizeType m_nclasses;
    SizeType m_npredict{0};
};

// Saliency read from a fixed per-token table, unknown tokens score 1
class TableScorer final : public saliency::SaliencyScorer {
public:
    explicit TableScorer(std::map<TokenId, float> table)
        : m_table(std::move(table)) {}

    saliency::TokenScores
    score(std::span<const Sequence> xs,
          std::span<const LabelType> /*ys*/ = {}) override {
        ++m_ncalls;
        saliency::TokenScores scores;
        for (const auto& x : xs) {
            std::vector<float> row;
            for (const auto token : x) {
                const auto it = m_table.find(token);
                row.push_back(it == m_table.end() ? 1.0F : it->second);
            }
            scores.push_back(std::move(row));
        }
        return scores;
    }

    SizeType get_ncalls() const { return m_ncalls; }

private:
    std::map<TokenId, float> m_table;
    SizeType m_ncalls{0};
};

inline constexpr TokenId kEos = 0;

inline xt::xtensor<float, 2> randn(SizeType rows, SizeType cols,
                                   std::mt19937& gen) {
    std::normal_distribution<float> dis(0.0F, 1.0F);
    auto arr = xt::xtensor<float, 2>::from_shape({rows, cols});
    std::generate(arr.begin(), arr.end(), [&]() { return dis(gen); });
    return arr;
}

inline model::BagOfEmbeddingsClassifier
make_random_classifier(SizeType vocab_size,
                       SizeType embed_dim,
                       SizeType nclasses,
                       std::mt19937& gen) {
    auto embed  = randn(vocab_size, embed_dim, gen);
    auto weight = randn(nclasses, embed_dim, gen);
    auto bias   = xt::xtensor<float, 1>::from_shape({nclasses});
    std::normal_distribution<float> dis(0.0F, 0.1F);
    std::generate(bias.begin(), bias.end(), [&]() { return dis(gen); });
    return {std::move(embed), std::move(weight), std::move(bias)};
}

// Random sequences of tokens in [1, vocab_size) ending with kEos
inline std::vector<Sequence> make_random_sequences(SizeType n,
                                                   SizeType min_len,
                                                   SizeType max_len,
                                                   SizeType vocab_size,
                                                   std::mt19937& gen) {
    std::uniform_int_distribution<SizeType> len_dis(min_len, max_len);
    std::uniform_int_distribution<TokenId> tok_dis(
        1, static_cast<TokenId>(vocab_size - 1));
    std::vector<Sequence> xs(n);
    for (auto& x : xs) {
        x.resize(len_dis(gen));
        std::generate(x.begin(), x.end(), [&]() { return tok_dis(gen); });
        x.back() = kEos;
    }
    return xs;
}

} // namespace rawr::testing
