#pragma once

#include "rawr/common/types.hpp" // IWYU pragma: export

#include "rawr/algorithms/beam.hpp"            // IWYU pragma: export
#include "rawr/algorithms/rawr.hpp"            // IWYU pragma: export
#include "rawr/data/dataset.hpp"               // IWYU pragma: export
#include "rawr/model/backend.hpp"              // IWYU pragma: export
#include "rawr/model/bag_of_embeddings.hpp"    // IWYU pragma: export
#include "rawr/pipelines/rawr_pipeline.hpp"    // IWYU pragma: export
#include "rawr/saliency/saliency.hpp"          // IWYU pragma: export
#include "rawr/search/configs.hpp"             // IWYU pragma: export
#include "rawr/search/setup.hpp"               // IWYU pragma: export
