#include "options.hpp"

#include <charconv>
#include <format>
#include <string_view>
#include <system_error>

namespace rawr::cli {

namespace {

template <typename T>
T parse_number(std::string_view flag, std::string_view value) {
    T result{};
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        throw UsageError(
            std::format("Invalid value for {}: '{}'", flag, value));
    }
    return result;
}

SizeType parse_positive(std::string_view flag, std::string_view value) {
    const auto v = parse_number<long long>(flag, value);
    if (v <= 0) {
        throw UsageError(
            std::format("{} must be a positive integer, got {}", flag, v));
    }
    return static_cast<SizeType>(v);
}

} // namespace

Options parse_options(const std::vector<std::string>& args) {
    Options opt;
    bool has_setup = false;
    for (SizeType i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto next_value      = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError(std::format("Missing value for {}", a));
            }
            return args[++i];
        };
        if (a == "--help" || a == "-h") {
            opt.help = true;
            return opt;
        }
        if (a == "--model-setup") {
            opt.model_setup = next_value();
            has_setup       = true;
        } else if (a == "--gpu" || a == "-g") {
            opt.device = parse_number<int>(a, next_value());
        } else if (a == "--lsh") {
            opt.use_lsh = true;
        } else if (a == "--output") {
            opt.output_path = next_value();
        } else if (a == "--beam-size") {
            opt.max_beam_size = parse_positive(a, next_value());
        } else if (a == "--batch-size") {
            opt.batch_size = parse_positive(a, next_value());
        } else if (a == "--max-batches") {
            opt.max_batches = parse_positive(a, next_value());
        } else if (a == "--threads") {
            opt.nthreads = static_cast<int>(parse_positive(a, next_value()));
        } else if (a == "--verbose" || a == "-v") {
            opt.verbose = true;
        } else {
            throw UsageError(std::format("Unknown option: {}", a));
        }
    }
    if (!has_setup) {
        throw UsageError("Missing required option --model-setup");
    }
    return opt;
}

std::string usage(std::string_view argv0) {
    return std::format(
        "Usage: {} --model-setup <path> [options]\n"
        "\n"
        "Options:\n"
        "  --model-setup <path>  JSON model-setup descriptor (required)\n"
        "  -g, --gpu <n>         Compute device, negative for CPU (default: -1)\n"
        "  --lsh                 Request approximate neighbour search\n"
        "  --output <file>       Checkpoint file (overrides output_path)\n"
        "  --beam-size <n>       Maximum beams per example\n"
        "  --batch-size <n>      Examples per batch\n"
        "  --max-batches <n>     Number of batches to process\n"
        "  --threads <n>         Threads of the reference backend\n"
        "  -v, --verbose         Debug logging\n"
        "  -h, --help            Show this help\n",
        argv0.empty() ? "rawr" : argv0);
}

} // namespace rawr::cli
