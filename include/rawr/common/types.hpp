#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rawr {

using SizeType  = std::size_t;
using IndexType = std::ptrdiff_t;
using TokenId   = std::int32_t;
using LabelType = std::int32_t;

// Token ids of one sentence. The last element is the terminator (<eos>).
using Sequence = std::vector<TokenId>;

// Positions in the original (un-reduced) sequence
using PositionList = std::vector<SizeType>;

inline constexpr SizeType kDefaultMaxBeamSize = 5;
inline constexpr SizeType kDefaultBatchSize   = 64;

} // namespace rawr
