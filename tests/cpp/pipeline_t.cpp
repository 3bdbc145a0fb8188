#include <filesystem>
#include <format>
#include <random>
#include <span>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <highfive/highfive.hpp>

#include "rawr/cands.hpp"
#include "rawr/data/dataset.hpp"
#include "rawr/model/backend.hpp"
#include "rawr/pipelines/rawr_pipeline.hpp"
#include "rawr/search/configs.hpp"
#include "test_models.hpp"

using rawr::LabelType;
using rawr::Sequence;
using rawr::SizeType;
using rawr::pipelines::RawrPipeline;
using rawr::search::RawrSearchConfig;

namespace {

// Greedy labels shifted by one class relative to the argmax of predict_proba
class ShiftedLabelModel final : public rawr::model::ModelBackend {
public:
    explicit ShiftedLabelModel(rawr::model::ModelBackend& inner)
        : m_inner(inner) {}

    std::vector<LabelType> predict(std::span<const Sequence> xs) override {
        auto ys = m_inner.predict(xs);
        for (auto& y : ys) {
            y = static_cast<LabelType>((static_cast<SizeType>(y) + 1) %
                                       get_nclasses());
        }
        return ys;
    }
    std::vector<std::vector<float>>
    predict_proba(std::span<const Sequence> xs) override {
        return m_inner.predict_proba(xs);
    }
    rawr::model::EmbeddingGrads
    embedding_grads(std::span<const Sequence> xs,
                    std::span<const LabelType> ys) override {
        return m_inner.embedding_grads(xs, ys);
    }
    SizeType get_nclasses() const override { return m_inner.get_nclasses(); }

private:
    rawr::model::ModelBackend& m_inner;
};

} // namespace

TEST_CASE("RawrPipeline process_batch", "[pipeline]") {
    std::mt19937 gen(99); // NOLINT
    auto model = rawr::testing::make_random_classifier(30, 6, 3, gen);
    const auto xs = rawr::testing::make_random_sequences(10, 2, 7, 30, gen);
    const std::vector<LabelType> labels(xs.size(), 2);
    const auto ys_0 = model.predict(xs);

    RawrPipeline pipeline(RawrSearchConfig(3, 4), model, false);
    const auto entries = pipeline.process_batch(xs, labels);
    REQUIRE(entries.size() == xs.size());
    for (SizeType i = 0; i < xs.size(); ++i) {
        REQUIRE_FALSE(entries[i].empty());
        for (const auto& entry : entries[i]) {
            REQUIRE(entry.original_input == xs[i]);
            REQUIRE(entry.original_prediction == ys_0[i]);
            REQUIRE(entry.reduced_prediction == entry.original_prediction);
            REQUIRE(entry.original_scores.size() == 3);
            REQUIRE(entry.reduced_scores.size() == 3);
            REQUIRE(entry.label == 2);
            REQUIRE(entry.reduced_input.size() +
                        entry.removed_indices.size() ==
                    xs[i].size());
        }
    }
    REQUIRE_THROWS(pipeline.process_batch(xs, std::vector<LabelType>{1}));
}

TEST_CASE("RawrPipeline original prediction follows predict",
          "[pipeline]") {
    std::mt19937 gen(17); // NOLINT
    auto inner = rawr::testing::make_random_classifier(30, 6, 3, gen);
    ShiftedLabelModel model(inner);
    const auto xs = rawr::testing::make_random_sequences(6, 2, 6, 30, gen);
    const std::vector<LabelType> labels(xs.size(), 0);
    const auto ys_0     = model.predict(xs);
    const auto argmax_0 = inner.predict(xs);

    RawrPipeline pipeline(RawrSearchConfig(2, 4), model, false);
    const auto entries = pipeline.process_batch(xs, labels);
    REQUIRE(entries.size() == xs.size());
    for (SizeType i = 0; i < xs.size(); ++i) {
        REQUIRE(ys_0[i] != argmax_0[i]);
        for (const auto& entry : entries[i]) {
            REQUIRE(entry.original_prediction == ys_0[i]);
            REQUIRE(model.predict(std::vector<Sequence>{entry.reduced_input})
                        .front() == ys_0[i]);
        }
    }
}

TEST_CASE("RawrPipeline checkpoint", "[pipeline]") {
    std::mt19937 gen(5); // NOLINT
    auto model = rawr::testing::make_random_classifier(30, 6, 2, gen);
    const auto xs = rawr::testing::make_random_sequences(7, 1, 6, 30, gen);
    std::vector<LabelType> labels(xs.size());
    for (SizeType i = 0; i < xs.size(); ++i) {
        labels[i] = static_cast<LabelType>(i % 2);
    }
    const auto dataset = rawr::data::SequenceDataset::from_sequences(xs, labels);
    const auto outfile =
        std::filesystem::temp_directory_path() / "rawr_pipeline_t.h5";

    SECTION("Batch limit") {
        RawrPipeline pipeline(RawrSearchConfig(2, 3, 2), model, false);
        REQUIRE(pipeline.execute(dataset, outfile) == 6);
    }
    SECTION("Layout") {
        RawrPipeline pipeline(RawrSearchConfig(2, 3), model, false);
        REQUIRE(pipeline.execute(dataset, outfile) == xs.size());
        REQUIRE(pipeline.get_stats().get_nrounds() > 0);

        HighFive::File file(outfile.string(), HighFive::File::ReadOnly);
        REQUIRE(file.getAttribute("rawr_version").read<std::string>() ==
                "1.0.0-cpp");
        REQUIRE(file.getAttribute("max_beam_size").read<SizeType>() == 2);
        REQUIRE(file.getAttribute("n_examples").read<SizeType>() ==
                xs.size());
        REQUIRE(file.exist("search_stats"));

        const auto examples = file.getGroup("examples");
        REQUIRE(examples.getNumberObjects() == xs.size());
        for (SizeType i = 0; i < xs.size(); ++i) {
            const auto example = examples.getGroup(std::format("{:06d}", i));
            const auto n_results =
                example.getAttribute("n_results").read<SizeType>();
            REQUIRE(n_results >= 1);
            const auto entry = example.getGroup("000");
            REQUIRE(entry.getDataSet("original_input").read<Sequence>() ==
                    xs[i]);
            REQUIRE(entry.getAttribute("label").read<LabelType>() ==
                    labels[i]);
            const auto removed =
                entry.getDataSet("removed_indices").read<std::vector<SizeType>>();
            const auto reduced =
                entry.getDataSet("reduced_input").read<Sequence>();
            REQUIRE(removed.size() + reduced.size() == xs[i].size());
            REQUIRE(entry.getAttribute("reduced_prediction").read<LabelType>() ==
                    entry.getAttribute("original_prediction").read<LabelType>());
        }
    }
    std::filesystem::remove(outfile);
}

TEST_CASE("CheckpointWriter append", "[pipeline]") {
    const auto outfile =
        std::filesystem::temp_directory_path() / "rawr_checkpoint_t.h5";
    rawr::pipelines::RawrEntry entry{.original_input      = {4, 17, 9, 2},
                                     .reduced_input       = {4, 17, 2},
                                     .original_prediction = 1,
                                     .reduced_prediction  = 1,
                                     .original_scores     = {0.2F, 0.8F},
                                     .reduced_scores      = {0.3F, 0.7F},
                                     .removed_indices     = {2},
                                     .label               = 1};
    const std::vector<rawr::pipelines::ExampleEntries> batch = {{entry},
                                                                {entry, entry}};
    {
        rawr::cands::CheckpointWriter writer(
            outfile, rawr::cands::CheckpointWriter::Mode::kWrite);
        writer.write_metadata(5, 64);
        REQUIRE(writer.write_batch(batch) == 2);
        REQUIRE(writer.write_batch(batch) == 4);
        REQUIRE_THROWS(writer.write_metadata(5, 64));
    }
    {
        rawr::cands::CheckpointWriter writer(
            outfile, rawr::cands::CheckpointWriter::Mode::kAppend);
        REQUIRE(writer.write_batch(batch) == 6);
    }
    HighFive::File file(outfile.string(), HighFive::File::ReadOnly);
    REQUIRE(file.getAttribute("n_examples").read<SizeType>() == 6);
    const auto example = file.getGroup("examples").getGroup("000003");
    REQUIRE(example.getAttribute("n_results").read<SizeType>() == 2);
    REQUIRE(example.getGroup("001")
                .getDataSet("removed_indices")
                .read<std::vector<SizeType>>() == std::vector<SizeType>{2});
    std::filesystem::remove(outfile);
}
