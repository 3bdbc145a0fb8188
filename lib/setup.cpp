#include "rawr/search/setup.hpp"

#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "rawr/common/types.hpp"

namespace rawr::search {

namespace {
using nlohmann::json;

std::filesystem::path resolve_path(const std::filesystem::path& base_dir,
                                   const std::string& value) {
    std::filesystem::path path(value);
    return path.is_absolute() ? path : base_dir / path;
}

std::string require_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        throw std::runtime_error(std::format(
            "Model setup: missing or non-string required key '{}'", key));
    }
    return j.at(key).get<std::string>();
}

SizeType get_positive(const json& j, const char* key, SizeType fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_unsigned() || value.get<SizeType>() == 0) {
        throw std::runtime_error(std::format(
            "Model setup: '{}' must be a positive integer", key));
    }
    return value.get<SizeType>();
}
} // namespace

ModelSetup ModelSetup::from_file(const std::filesystem::path& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        throw std::runtime_error(std::format(
            "Cannot open model setup file: {}", filepath.string()));
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::format(
            "Model setup {} is not valid JSON: {}", filepath.string(),
            e.what()));
    }
    if (!j.is_object()) {
        throw std::runtime_error("Model setup must be a JSON object");
    }

    const auto base_dir = filepath.parent_path();
    ModelSetup setup;
    setup.model_path   = resolve_path(base_dir, require_string(j, "model_path"));
    setup.dataset_path =
        resolve_path(base_dir, require_string(j, "dataset_path"));
    if (j.contains("output_path")) {
        setup.output_path =
            resolve_path(base_dir, require_string(j, "output_path"));
    }
    setup.max_beam_size =
        get_positive(j, "max_beam_size", setup.max_beam_size);
    setup.batch_size = get_positive(j, "batch_size", setup.batch_size);
    if (j.contains("max_batches") && j.at("max_batches").is_null()) {
        setup.max_batches = std::nullopt;
    } else {
        setup.max_batches =
            get_positive(j, "max_batches", kDefaultMaxBatches);
    }
    if (j.contains("nthreads")) {
        if (!j.at("nthreads").is_number_integer()) {
            throw std::runtime_error(
                "Model setup: 'nthreads' must be an integer");
        }
        setup.nthreads = j.at("nthreads").get<int>();
    }
    spdlog::info("Model setup {}: model={}, dataset={}, output={}",
                 filepath.string(), setup.model_path.string(),
                 setup.dataset_path.string(), setup.output_path.string());
    return setup;
}

RawrSearchConfig ModelSetup::make_config(int device, bool use_lsh) const {
    return RawrSearchConfig(max_beam_size, batch_size, max_batches, nthreads,
                            device, use_lsh);
}

} // namespace rawr::search
