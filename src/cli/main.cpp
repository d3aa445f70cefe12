#include <csignal>
#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "videoml/cli/commands.h"
#include "videoml/core/errors.h"

namespace {

void handle_signal(int) {
    videoml::cli::interrupt_flag().store(true);
}

int report_failure(const char* command, const std::exception& e) {
    int code = videoml::exit_code_for(e);
    if (code == 2) {
        spdlog::error("{}", e.what());
    } else {
        spdlog::error("{} failed: {}", command, e.what());
    }
    return code;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"vml: build and render orchestrator for VideoML compositions"};
    app.require_subcommand(1);

    // Global options
    std::string log_level = "info";
    app.add_option("--log-level", log_level, "Log level (trace/debug/info/warn/error)")
       ->default_val("info");

    // ─── generate ──────────────────────────────────────────────────

    auto* generate_cmd = app.add_subcommand("generate", "Generate script, timeline and audio");

    videoml::cli::GenerateArgs gen;
    generate_cmd->add_option("source", gen.source,
                             "Path to a .babulus.ts or .babulus.xml file or directory");
    generate_cmd->add_option("--script-out", gen.script_out, "Output script JSON path");
    generate_cmd->add_option("--timeline-out", gen.timeline_out, "Output timeline JSON path");
    generate_cmd->add_option("--audio-out", gen.audio_out, "Output audio path");
    generate_cmd->add_option("--out-dir", gen.out_dir, "Intermediate output dir");
    generate_cmd->add_option("--usage-out", gen.usage_out, "Usage ledger output path");
    generate_cmd->add_flag("--no-usage", gen.no_usage, "Disable usage ledger");
    generate_cmd->add_option("--env,--environment", gen.environment,
                             "Environment for provider selection");
    generate_cmd->add_option("--provider", gen.provider, "Override voiceover provider");
    generate_cmd->add_option("--sfx-provider", gen.sfx_provider, "Override SFX provider");
    generate_cmd->add_option("--music-provider", gen.music_provider, "Override music provider");
    generate_cmd->add_option("--seed", gen.seed, "Override voiceover seed");
    generate_cmd->add_flag("--fresh", gen.fresh, "Force regeneration of all audio");
    generate_cmd->add_flag("--watch", gen.watch, "Watch sources and re-run generation");
    generate_cmd->add_flag("--quiet", gen.quiet, "Suppress normal progress output");
    generate_cmd->add_option("--project-dir", gen.project_dir,
                             "Project root directory (prefix for outputs)");

    // ─── render ────────────────────────────────────────────────────

    auto* render_cmd = app.add_subcommand("render", "Render frames and encode a video");

    videoml::RenderInputs render_inputs;
    videoml::RenderOptions render_opts;
    std::string script_path, frames_dir, out_path;
    std::optional<std::string> timeline_path, audio_path, browser_bundle;
    bool no_clean = false;
    std::string ffmpeg_path = "ffmpeg";

    render_cmd->add_option("--script", script_path, "Path to script.json")->required();
    render_cmd->add_option("--frames", frames_dir, "Output directory for PNG frames")->required();
    render_cmd->add_option("--out", out_path, "Output MP4 path")->required();
    render_cmd->add_option("--timeline", timeline_path, "Optional timeline.json for duration data");
    render_cmd->add_option("--audio", audio_path, "Optional audio file path");
    render_cmd->add_option("--title", render_opts.title, "Storyboard title");
    render_cmd->add_option("--subtitle", render_opts.subtitle, "Storyboard subtitle");
    render_cmd->add_option("--start", render_opts.start_frame, "Start frame")->default_val(0);
    render_cmd->add_option("--end", render_opts.end_frame, "End frame (inclusive)");
    render_cmd->add_option("--pattern", render_opts.frame_pattern, "Frame filename pattern")
              ->default_val("frame-%06d.png");
    render_cmd->add_option("--scale", render_opts.scale, "Device scale factor")->default_val(1);
    render_cmd->add_option("--workers", render_opts.workers,
                           "Parallel frame workers (set 1 to disable)");
    render_cmd->add_option("--browser-bundle", browser_bundle,
                           "Browser bundle (defaults to BABULUS_BROWSER_BUNDLE)");
    render_cmd->add_option("--ffmpeg-arg", render_opts.ffmpeg_args,
                           "Extra ffmpeg argument (repeat for multiple)")
              ->allow_extra_args(false);
    render_cmd->add_option("--fps", render_opts.fps, "Override fps");
    render_cmd->add_option("--width", render_opts.width, "Override width");
    render_cmd->add_option("--height", render_opts.height, "Override height");
    render_cmd->add_option("--duration", render_opts.duration_frames, "Override duration frames");
    render_cmd->add_flag("--debug-layout", render_opts.debug_layout,
                         "Show layout bounds (dev-only helper)");
    render_cmd->add_flag("--no-clean", no_clean,
                         "Skip cleaning existing frames before rendering");
    render_cmd->add_option("--ffmpeg", ffmpeg_path, "ffmpeg binary path")->default_val("ffmpeg");

    // ─── pipeline ──────────────────────────────────────────────────

    auto* pipeline_cmd = app.add_subcommand("pipeline", "Generate then render one composition");

    videoml::cli::PipelineArgs pipe;
    pipeline_cmd->add_option("source", pipe.source,
                             "Path to a .babulus.ts or .babulus.xml file or directory");
    pipeline_cmd->add_option("--out", pipe.out, "Output MP4 path");
    pipeline_cmd->add_option("--frames", pipe.frames, "Output directory for PNG frames");
    pipeline_cmd->add_option("--project-dir", pipe.project_dir,
                             "Project root directory (prefix for outputs)");

    // ────────────────────────────────────────────────────────────────

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? 0 : 2;
    }

    // Configure logging
    auto console = spdlog::stderr_color_mt("vml");
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::from_str(log_level));
    if (gen.quiet && generate_cmd->parsed()) {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto cwd = std::filesystem::current_path();

    // ─── Dispatch ──────────────────────────────────────────────────

    if (generate_cmd->parsed()) {
        try {
            videoml::cli::run_generate(gen, cwd);
        } catch (const std::exception& e) {
            return report_failure("Generate", e);
        }
        return 0;
    }

    if (render_cmd->parsed()) {
        try {
            render_inputs.script = script_path;
            if (timeline_path) render_inputs.timeline = *timeline_path;
            if (audio_path)    render_inputs.audio    = *audio_path;
            if (browser_bundle) render_opts.browser_bundle = *browser_bundle;
            render_opts.frames_dir   = frames_dir;
            render_opts.output_path  = out_path;
            render_opts.ffmpeg       = ffmpeg_path;
            render_opts.clean_frames = !no_clean;

            auto output = videoml::cli::run_render(render_inputs, render_opts, cwd);
            videoml::cli::print_written(stdout, output);
        } catch (const std::exception& e) {
            return report_failure("Render", e);
        }
        return 0;
    }

    if (pipeline_cmd->parsed()) {
        try {
            auto output = videoml::cli::run_pipeline(pipe, cwd);
            videoml::cli::print_written(stdout, output);
        } catch (const std::exception& e) {
            return report_failure("Pipeline", e);
        }
        return 0;
    }

    return 0;
}
