#pragma once

#include <optional>

#include "rawr/common/types.hpp"

namespace rawr::search {

class RawrSearchConfig {
public:
    explicit RawrSearchConfig(SizeType max_beam_size = kDefaultMaxBeamSize,
                              SizeType batch_size    = kDefaultBatchSize,
                              std::optional<SizeType> max_batches = std::nullopt,
                              int nthreads                        = 1,
                              int device                          = -1,
                              bool use_lsh                        = false);

    // Getters
    [[nodiscard]] SizeType get_max_beam_size() const { return m_max_beam_size; }
    [[nodiscard]] SizeType get_batch_size() const { return m_batch_size; }
    [[nodiscard]] std::optional<SizeType> get_max_batches() const {
        return m_max_batches;
    }
    [[nodiscard]] int get_nthreads() const { return m_nthreads; }
    [[nodiscard]] int get_device() const { return m_device; }
    [[nodiscard]] bool get_use_lsh() const { return m_use_lsh; }
    [[nodiscard]] bool use_gpu() const { return m_device >= 0; }

    // Number of batches to process out of `nbatches` available
    [[nodiscard]] SizeType get_nbatches(SizeType nbatches) const;

private:
    void validate() const;

    SizeType m_max_beam_size;
    SizeType m_batch_size;
    std::optional<SizeType> m_max_batches;
    int m_nthreads;
    int m_device;
    bool m_use_lsh;
};

} // namespace rawr::search
