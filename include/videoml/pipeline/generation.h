#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>

#include "videoml/adapters/adapter.h"
#include "videoml/core/types.h"
#include "videoml/pipeline/artifact_paths.h"

namespace videoml {

namespace fs = std::filesystem;

/// Sources a rebuild is limited to; nullopt means every run.
using SourceScope = std::optional<std::set<SourcePath>>;

// ─── Generation Plan ───────────────────────────────────────────────

/// Everything shared by the generation requests of one invocation.
struct GenerationPlan {
    std::optional<fs::path>     project_dir;
    ArtifactOverrides           overrides;
    nlohmann::json              config = nlohmann::json::object();
    GenerationOptions           options;
    bool                        quiet{false};
    RootFinder                  find_root;      // empty = find_project_root

    /// Output overrides, including an explicit usage ledger path.
    [[nodiscard]] bool has_output_overrides() const {
        return overrides.any() || options.usage.mode == UsageLedger::Mode::Path;
    }
};

// ─── Generation Orchestrator ───────────────────────────────────────

/// Generates compositions one at a time, in run and declaration order.
/// Every check runs before the first generator call; the first failure
/// aborts the rest of the batch.
class GenerationOrchestrator {
public:
    GenerationOrchestrator(CompositionGenerator& generator, GenerationPlan plan);

    /// Validate the whole run set and build the requests for `scope`.
    /// Throws ValidationError when overrides are combined with anything
    /// but exactly one composition, or when two compositions would write
    /// the same artifact path.
    [[nodiscard]] std::vector<GenerationRequest> plan_batch(const std::vector<SourceRun>& runs,
                                                            const SourceScope& scope = std::nullopt) const;

    /// Plan, then generate. Returns the requests that were generated.
    std::vector<GenerationRequest> run_batch(const std::vector<SourceRun>& runs,
                                             const SourceScope& scope = std::nullopt);

    [[nodiscard]] const GenerationPlan& plan() const { return plan_; }

private:
    CompositionGenerator&   generator_;
    GenerationPlan          plan_;

    void check_collisions(const std::vector<SourceRun>& runs) const;
    [[nodiscard]] GenerationRequest make_request(const SourceRun& run,
                                                 const CompositionUnit& comp) const;
};

}  // namespace videoml
