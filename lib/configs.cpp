#include "rawr/search/configs.hpp"

#include <algorithm>
#include <omp.h>
#include <string>

#include <spdlog/spdlog.h>

#include "rawr/common/types.hpp"
#include "rawr/exceptions.hpp"

namespace rawr::search {

RawrSearchConfig::RawrSearchConfig(SizeType max_beam_size,
                                   SizeType batch_size,
                                   std::optional<SizeType> max_batches,
                                   int nthreads,
                                   int device,
                                   bool use_lsh)
    : m_max_beam_size(max_beam_size),
      m_batch_size(batch_size),
      m_max_batches(max_batches),
      m_nthreads(nthreads),
      m_device(device),
      m_use_lsh(use_lsh) {
    validate();
    m_nthreads = std::clamp(m_nthreads, 1, omp_get_max_threads());

    spdlog::info("RawrSearchConfig: max_beam_size={}, batch_size={}, "
                 "max_batches={}, nthreads={}, device={}, use_lsh={}",
                 m_max_beam_size, m_batch_size,
                 m_max_batches.has_value()
                     ? std::to_string(m_max_batches.value())
                     : "all",
                 m_nthreads, m_device, m_use_lsh);
}

SizeType RawrSearchConfig::get_nbatches(SizeType nbatches) const {
    return m_max_batches.has_value() ? std::min(nbatches, *m_max_batches)
                                     : nbatches;
}

void RawrSearchConfig::validate() const {
    error_check::check_greater(m_max_beam_size, 0U,
                               "max_beam_size must be positive");
    error_check::check_greater(m_batch_size, 0U,
                               "batch_size must be positive");
    if (m_max_batches.has_value()) {
        error_check::check_greater(*m_max_batches, 0U,
                                   "max_batches must be positive when set");
    }
}

} // namespace rawr::search
