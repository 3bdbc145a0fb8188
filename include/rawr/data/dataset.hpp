#pragma once

#include <filesystem>
#include <span>
#include <vector>

#include "rawr/common/types.hpp"

namespace rawr::data {

struct Batch {
    std::vector<Sequence> xs;
    std::vector<LabelType> ys;

    [[nodiscard]] SizeType size() const noexcept { return xs.size(); }
};

/**
 * @brief Labelled, pre-tokenized sequences in a ragged (CSR) layout.
 *
 * Sequence i is `tokens[offsets[i]:offsets[i + 1]]` with label `labels[i]`.
 */
class SequenceDataset {
public:
    SequenceDataset(std::vector<TokenId> tokens,
                    std::vector<SizeType> offsets,
                    std::vector<LabelType> labels);

    // Read the `tokens`, `offsets` and `labels` datasets of an HDF5 file
    static SequenceDataset from_file(const std::filesystem::path& filepath);

    // Build from already separated sequences
    static SequenceDataset from_sequences(std::span<const Sequence> xs,
                                          std::span<const LabelType> ys);

    [[nodiscard]] SizeType size() const noexcept { return m_labels.size(); }
    [[nodiscard]] SizeType get_ntokens() const noexcept {
        return m_tokens.size();
    }
    [[nodiscard]] std::span<const TokenId> get_tokens(SizeType i) const;
    [[nodiscard]] Sequence get_sequence(SizeType i) const;
    [[nodiscard]] LabelType get_label(SizeType i) const;
    // Sequences [start, start + count), clipped to the dataset size
    [[nodiscard]] Batch get_batch(SizeType start, SizeType count) const;

    void save(const std::filesystem::path& filepath) const;

private:
    std::vector<TokenId> m_tokens;
    std::vector<SizeType> m_offsets;
    std::vector<LabelType> m_labels;

    void validate() const;
};

// Serial batches in dataset order, without repeat or shuffle
class BatchIterator {
public:
    BatchIterator(const SequenceDataset& dataset, SizeType batch_size);

    [[nodiscard]] bool has_next() const noexcept;
    [[nodiscard]] Batch next();
    void reset() noexcept { m_position = 0; }

    [[nodiscard]] SizeType get_nbatches() const noexcept;
    [[nodiscard]] SizeType get_batch_idx() const noexcept;

private:
    const SequenceDataset& m_dataset;
    SizeType m_batch_size;
    SizeType m_position{0};
};

} // namespace rawr::data
