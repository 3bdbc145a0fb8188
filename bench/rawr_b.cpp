#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>
#include <xtensor/xtensor.hpp>

#include "rawr/algorithms/beam.hpp"
#include "rawr/algorithms/rawr.hpp"
#include "rawr/model/bag_of_embeddings.hpp"
#include "rawr/saliency/saliency.hpp"

namespace rawr::algorithms {

class RawrFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        nexamples = 32;
        seq_len   = static_cast<size_t>(state.range(0));
        std::mt19937 gen(42); // NOLINT
        std::normal_distribution<float> dis(0.0F, 1.0F);
        auto randn = [&](std::vector<size_t> shape) {
            auto arr = xt::xtensor<float, 2>::from_shape({shape[0], shape[1]});
            std::generate(arr.begin(), arr.end(), [&]() { return dis(gen); });
            return arr;
        };
        auto bias = xt::xtensor<float, 1>::from_shape({nclasses});
        std::generate(bias.begin(), bias.end(), [&]() { return dis(gen); });
        model = std::make_unique<model::BagOfEmbeddingsClassifier>(
            randn({vocab_size, embed_dim}), randn({nclasses, embed_dim}),
            bias);

        std::uniform_int_distribution<TokenId> tok(
            1, static_cast<TokenId>(vocab_size - 1));
        xs.assign(nexamples, Sequence(seq_len));
        for (auto& x : xs) {
            std::generate(x.begin(), x.end(), [&]() { return tok(gen); });
            x.back() = 0; // terminator
        }
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {
        model.reset();
        xs.clear();
    }

    static constexpr size_t vocab_size = 1000;
    static constexpr size_t embed_dim  = 64;
    static constexpr size_t nclasses   = 3;
    size_t nexamples{};
    size_t seq_len{};
    std::unique_ptr<model::BagOfEmbeddingsClassifier> model;
    std::vector<Sequence> xs;
};

BENCHMARK_DEFINE_F(RawrFixture, BM_rawr_saliency)(benchmark::State& state) {
    saliency::GradientSaliency scorer(*model);
    for (auto _ : state) {
        benchmark::DoNotOptimize(scorer.score(xs));
    }
}

BENCHMARK_DEFINE_F(RawrFixture, BM_rawr_remove_one)(benchmark::State& state) {
    saliency::GradientSaliency scorer(*model);
    const auto beams = BeamSet::from_sequences(xs);
    for (auto _ : state) {
        benchmark::DoNotOptimize(remove_one(scorer, beams));
    }
}

BENCHMARK_DEFINE_F(RawrFixture, BM_rawr_search)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(get_rawr(*model, xs));
    }
}

constexpr size_t kMinSeqLen = 1 << 3;
constexpr size_t kMaxSeqLen = 1 << 6;

BENCHMARK_REGISTER_F(RawrFixture, BM_rawr_saliency)
    ->RangeMultiplier(2)
    ->Range(kMinSeqLen, kMaxSeqLen);

BENCHMARK_REGISTER_F(RawrFixture, BM_rawr_remove_one)
    ->RangeMultiplier(2)
    ->Range(kMinSeqLen, kMaxSeqLen);

BENCHMARK_REGISTER_F(RawrFixture, BM_rawr_search)
    ->RangeMultiplier(2)
    ->Range(kMinSeqLen, kMaxSeqLen / 2);

} // namespace rawr::algorithms
