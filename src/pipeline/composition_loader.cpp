#include "videoml/pipeline/composition_loader.h"

#include <spdlog/spdlog.h>

namespace videoml {

std::vector<SourceRun> load_runs(CompositionLoader& loader,
                                 const std::vector<SourcePath>& sources) {
    std::vector<SourceRun> runs;
    runs.reserve(sources.size());

    for (const auto& source : sources) {
        SourceRun run;
        run.source       = source;
        run.compositions = loader.load(source);
        spdlog::debug("Loaded {} composition(s) from {}",
                      run.compositions.size(), source.string());
        runs.push_back(std::move(run));
    }
    return runs;
}

}  // namespace videoml
