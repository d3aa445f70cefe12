#include "videoml/cli/commands.h"

#include <chrono>
#include <cstdlib>
#include <thread>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "videoml/adapters/process_adapters.h"
#include "videoml/core/errors.h"
#include "videoml/pipeline/composition_loader.h"
#include "videoml/pipeline/file_watcher.h"
#include "videoml/pipeline/generation.h"
#include "videoml/pipeline/source_resolver.h"
#include "videoml/pipeline/watch_engine.h"

namespace videoml::cli {

namespace {

std::optional<fs::path> resolve_optional(const fs::path& cwd, const std::optional<std::string>& p) {
    if (!p) return std::nullopt;
    return absolute_from(cwd, *p);
}

std::vector<SourcePath> require_sources(const std::optional<std::string>& arg, const fs::path& cwd) {
    auto sources = resolve_sources(arg, cwd);
    if (sources.empty()) {
        throw NotFoundError("No composition sources found under " +
                            absolute_from(cwd, arg.value_or(".")).string());
    }
    return sources;
}

void default_browser_bundle(RenderOptions& options) {
    if (options.browser_bundle) return;
    if (const char* env = std::getenv("BABULUS_BROWSER_BUNDLE"); env && *env) {
        options.browser_bundle = fs::path(env);
    }
}

GenerationPlan make_plan(const GenerateArgs& args, const fs::path& cwd,
                         const std::optional<fs::path>& project_dir) {
    GenerationPlan plan;
    plan.project_dir        = project_dir;
    plan.overrides.script   = resolve_optional(cwd, args.script_out);
    plan.overrides.timeline = resolve_optional(cwd, args.timeline_out);
    plan.overrides.audio    = resolve_optional(cwd, args.audio_out);
    plan.overrides.out_dir  = resolve_optional(cwd, args.out_dir);

    auto& opts = plan.options;
    opts.provider       = args.provider;
    opts.sfx_provider   = args.sfx_provider;
    opts.music_provider = args.music_provider;
    opts.seed           = args.seed;
    opts.environment    = args.environment;
    opts.fresh          = args.fresh;
    if (args.no_usage) {
        opts.usage = UsageLedger::disabled();
    } else if (args.usage_out) {
        opts.usage = UsageLedger::at(absolute_from(cwd, *args.usage_out));
    }

    plan.quiet = args.quiet;
    return plan;
}

// ─── Watch session ─────────────────────────────────────────────────

void run_watch_session(GenerationPlan plan, std::vector<SourceRun> runs,
                       const ProjectConfig& config, bool quiet, std::stop_token stop) {
    auto& mgr = AdapterManager::instance();
    auto& loader = mgr.loader();
    auto& generator = mgr.generator();

    std::vector<SourcePath> sources;
    for (const auto& run : runs) sources.push_back(run.source);

    // Collaborators are registered once; tooling edits need a restart
    ToolingConfig tooling = config.tooling;

    // Runs on the engine's worker only; the engine never overlaps calls
    auto rebuild = [&](const SourceScope& scope) {
        if (!scope && config.path) {
            auto reloaded = ProjectConfig::from_file(*config.path);
            plan.config = reloaded.settings;
            if (reloaded.tooling != tooling) {
                spdlog::warn("Tooling commands in {} changed; restart the watch session to apply them",
                             config.path->string());
                tooling = reloaded.tooling;
            }
        }
        for (auto& run : runs) {
            if (scope && scope->count(run.source) == 0) continue;
            run.compositions = loader.load(run.source);
        }
        GenerationOrchestrator orchestrator(generator, plan);
        orchestrator.run_batch(runs, scope);
    };

    WatchEngine engine(WatchSession(sources, config.path), rebuild);
    DirectoryWatcher watcher([&engine](const fs::path& path) { engine.notify(path); });
    watcher.watch(engine.session().watched_directories());
    engine.start();

    spdlog::info("Watching for changes... (Ctrl+C to stop)");
    if (!quiet) {
        spdlog::info("Watching directories:");
        for (const auto& dir : engine.session().watched_directories()) {
            spdlog::info("  - {}", dir.string());
        }
    }

    while (!interrupt_flag().load() && !stop.stop_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Stopping watch session");
    watcher.stop();
    engine.stop();
}

}  // namespace

std::atomic<bool>& interrupt_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

void print_written(std::FILE* out, const fs::path& path) {
    fmt::print(out, "write: {}\n", path.string());
    std::fflush(out);
}

// ─── generate ──────────────────────────────────────────────────────

void run_generate(const GenerateArgs& args, const fs::path& cwd, std::stop_token stop) {
    auto project_dir = resolve_optional(cwd, args.project_dir);
    auto sources = require_sources(args.source, cwd);
    auto plan = make_plan(args, cwd, project_dir);

    if (args.watch && plan.has_output_overrides() && sources.size() != 1) {
        throw ValidationError("When using --watch with multiple sources, omit explicit output overrides.");
    }

    auto config = ProjectConfig::discover(project_dir, sources.front());
    plan.config = config.settings;
    adapters::register_builtin_adapters(config.tooling);
    auto& mgr = AdapterManager::instance();

    auto runs = load_runs(mgr.loader(), sources);

    if (!args.watch) {
        GenerationOrchestrator orchestrator(mgr.generator(), std::move(plan));
        orchestrator.run_batch(runs);
        return;
    }

    // Reject a bad batch before anything is watched
    {
        GenerationOrchestrator orchestrator(mgr.generator(), plan);
        (void)orchestrator.plan_batch(runs);
    }
    run_watch_session(std::move(plan), std::move(runs), config, args.quiet, std::move(stop));
}

// ─── render ────────────────────────────────────────────────────────

fs::path run_render(const RenderInputs& inputs, RenderOptions options, const fs::path& cwd) {
    default_browser_bundle(options);

    auto config = ProjectConfig::discover(std::nullopt, cwd);
    adapters::register_builtin_adapters(config.tooling);
    auto& mgr = AdapterManager::instance();

    RenderHandoff handoff(mgr.renderer(), mgr.encoder());
    return handoff.build_and_render(inputs, options, cwd);
}

// ─── pipeline ──────────────────────────────────────────────────────

fs::path run_pipeline(const PipelineArgs& args, const fs::path& cwd) {
    auto project_dir = resolve_optional(cwd, args.project_dir);
    auto sources = require_sources(args.source, cwd);
    if (sources.size() != 1) {
        throw ValidationError("Pipeline expects a single source path.");
    }

    auto config = ProjectConfig::discover(project_dir, sources.front());
    adapters::register_builtin_adapters(config.tooling);
    auto& mgr = AdapterManager::instance();

    auto runs = load_runs(mgr.loader(), sources);
    if (runs.front().compositions.size() != 1) {
        throw ValidationError("Pipeline requires a single composition in the source.");
    }

    GenerationPlan plan;
    plan.project_dir = project_dir;
    plan.config      = config.settings;
    GenerationOrchestrator orchestrator(mgr.generator(), std::move(plan));
    auto generated = orchestrator.run_batch(runs);

    const auto& request = generated.front();
    RenderOptions options;
    options.output_path = args.out
        ? absolute_from(cwd, *args.out)
        : default_video_path(project_dir, cwd, request.composition.id);
    options.frames_dir = args.frames
        ? absolute_from(cwd, *args.frames)
        : request.artifacts.out_dir / "frames";
    default_browser_bundle(options);

    auto inputs = RenderInputs::from_artifacts(request.artifacts);
    if (!fs::exists(*inputs.audio)) {
        spdlog::warn("No audio at {}, rendering without sound", inputs.audio->string());
        inputs.audio.reset();
    }

    RenderHandoff handoff(mgr.renderer(), mgr.encoder());
    return handoff.build_and_render(inputs, options, cwd);
}

}  // namespace videoml::cli
