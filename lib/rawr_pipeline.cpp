#include "rawr/pipelines/rawr_pipeline.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "rawr/algorithms/rawr.hpp"
#include "rawr/cands.hpp"
#include "rawr/exceptions.hpp"
#include "rawr/progress.hpp"
#include "rawr/saliency/saliency.hpp"
#include "rawr/timing.hpp"

namespace rawr::pipelines {

namespace {

LabelType argmax(std::span<const float> probs) {
    error_check::check_greater(probs.size(), 0U,
                               "argmax: empty probability vector");
    return static_cast<LabelType>(
        std::distance(probs.begin(), std::ranges::max_element(probs)));
}

} // namespace

class RawrPipeline::Impl {
public:
    Impl(search::RawrSearchConfig cfg,
         model::ModelBackend& model,
         bool show_progress)
        : m_cfg(std::move(cfg)),
          m_model(model),
          m_scorer(model),
          m_search(model, m_scorer, m_cfg.get_max_beam_size()),
          m_show_progress(show_progress) {
        if (m_cfg.use_gpu()) {
            spdlog::warn("Device {} requested, the reference backend runs on "
                         "CPU only",
                         m_cfg.get_device());
        }
        if (m_cfg.get_use_lsh()) {
            spdlog::info("LSH neighbour search requested, not used by the "
                         "reduction search");
        }
    }

    ~Impl()                      = default;
    Impl(const Impl&)            = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&)                 = delete;
    Impl& operator=(Impl&&)      = delete;

    const cands::SearchStatsCollection& get_stats() const noexcept {
        return m_stats;
    }

    std::vector<ExampleEntries> process_batch(std::span<const Sequence> xs,
                                              std::span<const LabelType> labels) {
        error_check::check_equal(labels.size(), xs.size(),
                                 "RawrPipeline: one label per input");
        if (xs.empty()) {
            return {};
        }
        const auto results = m_search.execute(xs);

        const auto original_scores = m_model.predict_proba(xs);
        error_check::check_equal(original_scores.size(), xs.size(),
                                 "RawrPipeline: one distribution per input");

        std::vector<Sequence> reduced;
        for (const auto& result : results) {
            for (const auto& reduction : result.get_reductions()) {
                reduced.push_back(reduction.tokens);
            }
        }
        const auto reduced_scores = m_model.predict_proba(reduced);
        error_check::check_equal(reduced_scores.size(), reduced.size(),
                                 "RawrPipeline: one distribution per "
                                 "reduction");

        std::vector<ExampleEntries> entries(xs.size());
        SizeType offset = 0;
        for (SizeType i = 0; i < xs.size(); ++i) {
            const auto& reductions = results[i].get_reductions();
            entries[i].reserve(reductions.size());
            for (const auto& reduction : reductions) {
                entries[i].push_back({
                    .original_input      = xs[i],
                    .reduced_input       = reduction.tokens,
                    .original_prediction = results[i].get_original_prediction(),
                    .reduced_prediction  = argmax(reduced_scores[offset]),
                    .original_scores     = original_scores[i],
                    .reduced_scores      = reduced_scores[offset],
                    .removed_indices     = reduction.removed_indices,
                    .label               = labels[i],
                });
                ++offset;
            }
        }
        return entries;
    }

    SizeType execute(const data::SequenceDataset& dataset,
                     const std::filesystem::path& outfile) {
        timing::ScopeTimer timer("RawrPipeline::execute");
        data::BatchIterator batches(dataset, m_cfg.get_batch_size());
        const auto nbatches = m_cfg.get_nbatches(batches.get_nbatches());
        spdlog::info("RawrPipeline: {} examples, processing {} of {} batches",
                     dataset.size(), nbatches, batches.get_nbatches());

        cands::CheckpointWriter writer(outfile,
                                       cands::CheckpointWriter::Mode::kWrite);
        writer.write_metadata(m_cfg.get_max_beam_size(),
                              m_cfg.get_batch_size());
        m_stats.reset();

        progress::ProgressGuard guard(m_show_progress);
        std::unique_ptr<progress::ProgressBar> bar;
        if (m_show_progress) {
            bar = progress::make_rawr_bar("Reducing", nbatches);
        }

        SizeType n_written = 0;
        double kept_sum    = 0.0;
        SizeType n_kept    = 0;
        for (SizeType ibatch = 0; ibatch < nbatches && batches.has_next();
             ++ibatch) {
            const auto batch   = batches.next();
            const auto entries = process_batch(batch.xs, batch.ys);
            n_written          = writer.write_batch(entries);
            m_stats.merge(m_search.get_stats(), ibatch);

            SizeType n_reduced = 0;
            for (const auto& example : entries) {
                const auto& first = example.front();
                kept_sum += static_cast<double>(first.reduced_input.size()) /
                            static_cast<double>(first.original_input.size());
                ++n_kept;
                if (!first.removed_indices.empty()) {
                    ++n_reduced;
                }
            }
            spdlog::info("Batch {:4d}: {} examples, {} reduced, {}", ibatch,
                         batch.size(), n_reduced,
                         m_search.get_stats().get_stats_summary());
            if (bar) {
                bar->set_kept(n_kept > 0 ? kept_sum / n_kept : 1.0);
                bar->set_progress(ibatch + 1);
            }
        }
        if (bar) {
            bar->mark_as_completed();
        }
        writer.write_stats(m_stats);
        spdlog::info("RawrPipeline: wrote {} examples to {}", n_written,
                     outfile.string());
        spdlog::info("{}", m_stats.get_concise_timer_summary());
        spdlog::debug("{}", m_stats.get_timer_summary());
        return n_written;
    }

private:
    search::RawrSearchConfig m_cfg;
    model::ModelBackend& m_model;
    saliency::GradientSaliency m_scorer;
    algorithms::RawrSearch m_search;
    bool m_show_progress;
    cands::SearchStatsCollection m_stats;
};

RawrPipeline::RawrPipeline(const search::RawrSearchConfig& cfg,
                           model::ModelBackend& model,
                           bool show_progress)
    : m_impl(std::make_unique<Impl>(cfg, model, show_progress)) {}
RawrPipeline::~RawrPipeline()                                  = default;
RawrPipeline::RawrPipeline(RawrPipeline&& other) noexcept      = default;
RawrPipeline& RawrPipeline::operator=(RawrPipeline&& other) noexcept = default;

std::vector<ExampleEntries>
RawrPipeline::process_batch(std::span<const Sequence> xs,
                            std::span<const LabelType> labels) {
    return m_impl->process_batch(xs, labels);
}

SizeType RawrPipeline::execute(const data::SequenceDataset& dataset,
                               const std::filesystem::path& outfile) {
    return m_impl->execute(dataset, outfile);
}

const cands::SearchStatsCollection& RawrPipeline::get_stats() const {
    return m_impl->get_stats();
}

} // namespace rawr::pipelines
