#include "videoml/pipeline/generation.h"

#include <chrono>
#include <map>

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

GenerationOrchestrator::GenerationOrchestrator(CompositionGenerator& generator,
                                               GenerationPlan plan)
    : generator_(generator), plan_(std::move(plan)) {}

GenerationRequest GenerationOrchestrator::make_request(const SourceRun& run,
                                                       const CompositionUnit& comp) const {
    GenerationRequest request;
    request.composition = comp;
    request.source      = run.source;
    request.artifacts   = derive_artifact_paths(comp.id, run.source, plan_.project_dir,
                                                plan_.overrides, plan_.find_root);
    request.config      = plan_.config;
    request.options     = plan_.options;
    request.options.verbose = !plan_.quiet;

    if (!plan_.quiet) {
        request.log = [id = comp.id](const std::string& message) {
            spdlog::info("{}: {}", id, message);
        };
    }
    return request;
}

void GenerationOrchestrator::check_collisions(const std::vector<SourceRun>& runs) const {
    struct Owner {
        const SourcePath*   source;
        std::string         id;
    };
    std::map<fs::path, Owner> writers;

    for (const auto& run : runs) {
        for (const auto& comp : run.compositions) {
            auto paths = derive_artifact_paths(comp.id, run.source, plan_.project_dir,
                                               plan_.overrides, plan_.find_root);
            for (const auto* path : {&paths.script, &paths.timeline, &paths.audio, &paths.out_dir}) {
                auto key = path->lexically_normal();
                auto [it, inserted] = writers.emplace(key, Owner{&run.source, comp.id});
                if (!inserted) {
                    throw ValidationError(
                        "Composition '" + comp.id + "' in " + run.source.string() +
                        " and composition '" + it->second.id + "' in " +
                        it->second.source->string() + " both write " + key.string() +
                        ". Rename one of them or pass --project-dir.");
                }
            }
        }
    }
}

std::vector<GenerationRequest> GenerationOrchestrator::plan_batch(const std::vector<SourceRun>& runs,
                                                                  const SourceScope& scope) const {
    if (plan_.has_output_overrides() && total_compositions(runs) != 1) {
        throw ValidationError("Output overrides require a single composition.");
    }
    check_collisions(runs);

    std::vector<GenerationRequest> requests;
    for (const auto& run : runs) {
        if (scope && scope->count(run.source) == 0) continue;
        for (const auto& comp : run.compositions) {
            requests.push_back(make_request(run, comp));
        }
    }
    return requests;
}

std::vector<GenerationRequest> GenerationOrchestrator::run_batch(const std::vector<SourceRun>& runs,
                                                                 const SourceScope& scope) {
    auto requests = plan_batch(runs, scope);
    auto start = std::chrono::steady_clock::now();

    for (const auto& request : requests) {
        spdlog::info("Generating '{}' from {}", request.composition.id, request.source.string());
        generator_.generate(request);
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Generated {} composition(s) in {:.0f} ms", requests.size(), elapsed);
    return requests;
}

}  // namespace videoml
