#pragma once

#include <filesystem>
#include <optional>

#include "rawr/common/types.hpp"
#include "rawr/search/configs.hpp"

namespace rawr::search {

inline constexpr SizeType kDefaultMaxBatches = 11;

/**
 * @brief Model-setup descriptor of a reduction run.
 *
 * JSON object with keys `model_path` and `dataset_path` (required),
 * `output_path`, `max_beam_size`, `batch_size`, `max_batches` (null for all
 * batches) and `nthreads`. Relative paths resolve against the directory of
 * the descriptor file.
 */
struct ModelSetup {
    std::filesystem::path model_path;
    std::filesystem::path dataset_path;
    std::filesystem::path output_path   = "rawr_dev.h5";
    SizeType max_beam_size              = kDefaultMaxBeamSize;
    SizeType batch_size                 = kDefaultBatchSize;
    std::optional<SizeType> max_batches = kDefaultMaxBatches;
    int nthreads                        = 1;

    static ModelSetup from_file(const std::filesystem::path& filepath);

    [[nodiscard]] RawrSearchConfig make_config(int device   = -1,
                                               bool use_lsh = false) const;
};

} // namespace rawr::search
