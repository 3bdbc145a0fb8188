#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "rawr/common/types.hpp"
#include "rawr/data/dataset.hpp"
#include "rawr/model/backend.hpp"
#include "rawr/search/configs.hpp"

namespace rawr::cands {
class SearchStatsCollection;
} // namespace rawr::cands

namespace rawr::pipelines {

// One tied-minimal reduction of an example, as stored in the checkpoint
struct RawrEntry {
    Sequence original_input;
    Sequence reduced_input;
    LabelType original_prediction{};
    LabelType reduced_prediction{};
    std::vector<float> original_scores;
    std::vector<float> reduced_scores;
    PositionList removed_indices;
    LabelType label{};
};

using ExampleEntries = std::vector<RawrEntry>;

/**
 * @brief Batch driver for the reduction search over a labelled dataset.
 *
 * Each batch is searched with gradient saliency from the same model. The
 * originals and all recorded reductions are then re-scored with softmax
 * probabilities, and one checkpoint record is produced per reduction.
 */
class RawrPipeline {
public:
    RawrPipeline(const search::RawrSearchConfig& cfg,
                 model::ModelBackend& model,
                 bool show_progress = true);

    ~RawrPipeline();
    RawrPipeline(RawrPipeline&&) noexcept;
    RawrPipeline& operator=(RawrPipeline&&) noexcept;
    RawrPipeline(const RawrPipeline&)            = delete;
    RawrPipeline& operator=(const RawrPipeline&) = delete;

    [[nodiscard]] std::vector<ExampleEntries>
    process_batch(std::span<const Sequence> xs,
                  std::span<const LabelType> labels);

    // Search the first `max_batches` batches and write the checkpoint.
    // Returns the number of examples written.
    SizeType execute(const data::SequenceDataset& dataset,
                     const std::filesystem::path& outfile);

    // Accumulated statistics of all batches processed so far
    [[nodiscard]] const cands::SearchStatsCollection& get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace rawr::pipelines
