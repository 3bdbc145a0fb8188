#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "options.hpp"
#include "rawr/rawr.hpp"

namespace {

rawr::search::ModelSetup apply_overrides(rawr::search::ModelSetup setup,
                                         const rawr::cli::Options& opt) {
    if (opt.output_path) {
        setup.output_path = *opt.output_path;
    }
    if (opt.max_beam_size) {
        setup.max_beam_size = *opt.max_beam_size;
    }
    if (opt.batch_size) {
        setup.batch_size = *opt.batch_size;
    }
    if (opt.max_batches) {
        setup.max_batches = *opt.max_batches;
    }
    if (opt.nthreads) {
        setup.nthreads = *opt.nthreads;
    }
    return setup;
}

int run(const rawr::cli::Options& opt) {
    const auto setup =
        apply_overrides(rawr::search::ModelSetup::from_file(opt.model_setup),
                        opt);
    spdlog::info("Model: {}, dataset: {}, output: {}",
                 setup.model_path.string(), setup.dataset_path.string(),
                 setup.output_path.string());

    const auto cfg = setup.make_config(opt.device, opt.use_lsh);
    auto model     = rawr::model::BagOfEmbeddingsClassifier::from_file(
        setup.model_path, cfg.get_nthreads());
    const auto dataset =
        rawr::data::SequenceDataset::from_file(setup.dataset_path);
    rawr::pipelines::RawrPipeline pipeline(cfg, *model);
    pipeline.execute(dataset, setup.output_path);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    const std::string argv0 = argc > 0 ? argv[0] : "rawr";
    rawr::cli::Options opt;
    try {
        opt = rawr::cli::parse_options(
            std::vector<std::string>(argv + 1, argv + argc));
    } catch (const rawr::cli::UsageError& e) {
        std::cerr << e.what() << "\n\n" << rawr::cli::usage(argv0);
        return 2;
    }
    if (opt.help) {
        std::cout << rawr::cli::usage(argv0);
        return EXIT_SUCCESS;
    }
    if (opt.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    try {
        return run(opt);
    } catch (const std::exception& e) {
        spdlog::error("rawr failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
