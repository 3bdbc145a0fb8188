#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "rawr/common/types.hpp"

namespace rawr::cli {

// Malformed command line, reported with the usage text and exit status 2
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Options {
    std::filesystem::path model_setup;
    int device   = -1;
    bool use_lsh = false;
    bool verbose = false;
    bool help    = false;
    // Overrides of the model-setup descriptor
    std::optional<std::filesystem::path> output_path;
    std::optional<SizeType> max_beam_size;
    std::optional<SizeType> batch_size;
    std::optional<SizeType> max_batches;
    std::optional<int> nthreads;
};

// Throws UsageError on unknown flags, missing or invalid values
Options parse_options(const std::vector<std::string>& args);

std::string usage(std::string_view argv0);

} // namespace rawr::cli
