#include "rawr/data/dataset.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include <highfive/highfive.hpp>
#include <spdlog/spdlog.h>

#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"

namespace rawr::data {

namespace {
template <typename T>
std::vector<T> read_vector(const HighFive::File& file, const std::string& name) {
    if (!file.exist(name)) {
        throw std::runtime_error(
            std::format("Dataset file is missing dataset '{}'", name));
    }
    std::vector<T> out;
    file.getDataSet(name).read(out);
    return out;
}
} // namespace

// --- SequenceDataset ---
SequenceDataset::SequenceDataset(std::vector<TokenId> tokens,
                                 std::vector<SizeType> offsets,
                                 std::vector<LabelType> labels)
    : m_tokens(std::move(tokens)),
      m_offsets(std::move(offsets)),
      m_labels(std::move(labels)) {
    validate();
}

SequenceDataset
SequenceDataset::from_file(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error(std::format("Dataset file does not exist: {}",
                                             filepath.string()));
    }
    HighFive::File file(filepath.string(), HighFive::File::ReadOnly);
    SequenceDataset dataset(read_vector<TokenId>(file, "tokens"),
                            read_vector<SizeType>(file, "offsets"),
                            read_vector<LabelType>(file, "labels"));
    spdlog::info("Loaded {} sequences ({} tokens) from {}", dataset.size(),
                 dataset.get_ntokens(), filepath.string());
    return dataset;
}

SequenceDataset
SequenceDataset::from_sequences(std::span<const Sequence> xs,
                                std::span<const LabelType> ys) {
    error_check::check_equal(xs.size(), ys.size(),
                             "from_sequences: one label per sequence");
    std::vector<TokenId> tokens;
    std::vector<SizeType> offsets{0};
    offsets.reserve(xs.size() + 1);
    for (const auto& x : xs) {
        tokens.insert(tokens.end(), x.begin(), x.end());
        offsets.push_back(tokens.size());
    }
    return {std::move(tokens), std::move(offsets),
            std::vector<LabelType>(ys.begin(), ys.end())};
}

std::span<const TokenId> SequenceDataset::get_tokens(SizeType i) const {
    error_check::check_range(i, size(), "SequenceDataset: sequence index");
    return std::span<const TokenId>(m_tokens).subspan(
        m_offsets[i], m_offsets[i + 1] - m_offsets[i]);
}

Sequence SequenceDataset::get_sequence(SizeType i) const {
    const auto tokens = get_tokens(i);
    return {tokens.begin(), tokens.end()};
}

LabelType SequenceDataset::get_label(SizeType i) const {
    error_check::check_range(i, size(), "SequenceDataset: label index");
    return m_labels[i];
}

Batch SequenceDataset::get_batch(SizeType start, SizeType count) const {
    const auto stop = std::min(start + count, size());
    Batch batch;
    for (SizeType i = start; i < stop; ++i) {
        batch.xs.push_back(get_sequence(i));
        batch.ys.push_back(m_labels[i]);
    }
    return batch;
}

void SequenceDataset::save(const std::filesystem::path& filepath) const {
    HighFive::File file(filepath.string(), HighFive::File::Overwrite);
    file.createDataSet("tokens", m_tokens);
    file.createDataSet("offsets", m_offsets);
    file.createDataSet("labels", m_labels);
}

void SequenceDataset::validate() const {
    error_check::check_equal(m_offsets.size(), m_labels.size() + 1,
                             "offsets must hold one entry per sequence + 1");
    error_check::check_equal(m_offsets.front(), 0U,
                             "offsets must start at 0");
    error_check::check_equal(m_offsets.back(), m_tokens.size(),
                             "offsets must end at the token count");
    for (SizeType i = 0; i + 1 < m_offsets.size(); ++i) {
        // every sequence holds at least its terminator
        error_check::check_greater(
            m_offsets[i + 1], m_offsets[i],
            std::format("sequence {} is empty or offsets decrease", i));
    }
}

// --- BatchIterator ---
BatchIterator::BatchIterator(const SequenceDataset& dataset,
                             SizeType batch_size)
    : m_dataset(dataset),
      m_batch_size(batch_size) {
    error_check::check_greater(m_batch_size, 0U,
                               "BatchIterator: batch_size must be positive");
}

bool BatchIterator::has_next() const noexcept {
    return m_position < m_dataset.size();
}

Batch BatchIterator::next() {
    if (!has_next()) {
        throw std::out_of_range("BatchIterator: no batches left");
    }
    auto batch = m_dataset.get_batch(m_position, m_batch_size);
    m_position += batch.size();
    return batch;
}

SizeType BatchIterator::get_nbatches() const noexcept {
    return (m_dataset.size() + m_batch_size - 1) / m_batch_size;
}

SizeType BatchIterator::get_batch_idx() const noexcept {
    return m_position / m_batch_size;
}

} // namespace rawr::data
