// About: The three vml subcommands. main.cpp parses flags into these
// structs; everything below is testable without a command line.
#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

#include "videoml/core/config.h"
#include "videoml/pipeline/render_handoff.h"

namespace videoml::cli {

namespace fs = std::filesystem;

struct GenerateArgs {
    std::optional<std::string>  source;
    std::optional<std::string>  script_out;
    std::optional<std::string>  timeline_out;
    std::optional<std::string>  audio_out;
    std::optional<std::string>  out_dir;
    std::optional<std::string>  usage_out;
    bool                        no_usage{false};
    std::optional<std::string>  environment;
    std::optional<std::string>  provider;
    std::optional<std::string>  sfx_provider;
    std::optional<std::string>  music_provider;
    std::optional<int64_t>      seed;
    bool                        fresh{false};
    bool                        watch{false};
    bool                        quiet{false};
    std::optional<std::string>  project_dir;
};

struct PipelineArgs {
    std::optional<std::string>  source;
    std::optional<std::string>  out;
    std::optional<std::string>  frames;
    std::optional<std::string>  project_dir;
};

/// Set from the SIGINT/SIGTERM handler; ends a watch session.
std::atomic<bool>& interrupt_flag();

/// One-shot generation, or a watch session until interrupt_flag() is set
/// or `stop` is requested. Loader and generator commands stay fixed for
/// the session; config settings are re-read on every full rebuild.
void run_generate(const GenerateArgs& args, const fs::path& cwd, std::stop_token stop = {});

/// The bare `write: <path>` line scripts read from stdout.
void print_written(std::FILE* out, const fs::path& path);

/// Render already generated artifacts. Returns the written video path.
fs::path run_render(const RenderInputs& inputs, RenderOptions options, const fs::path& cwd);

/// generate + render for exactly one composition. Returns the video path.
fs::path run_pipeline(const PipelineArgs& args, const fs::path& cwd);

}  // namespace videoml::cli
