#pragma once

#include <vector>

#include "videoml/adapters/adapter.h"
#include "videoml/core/types.h"

namespace videoml {

/// One loader call per source, in order. Loader failures propagate
/// unchanged; nothing is retried.
[[nodiscard]] std::vector<SourceRun> load_runs(CompositionLoader& loader,
                                               const std::vector<SourcePath>& sources);

}  // namespace videoml
