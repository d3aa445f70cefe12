#include "videoml/pipeline/render_handoff.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

namespace {

nlohmann::json load_json(const fs::path& path, const char* what) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw NotFoundError(std::string("Cannot read ") + what + ": " + path.string());
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Invalid ") + what + " JSON in " +
                              path.string() + ": " + e.what());
    }
}

uint32_t checked_u32(int64_t value, int64_t min, const char* flag) {
    if (value < min || value > std::numeric_limits<uint32_t>::max()) {
        throw ValidationError(std::string(flag) + " must be an integer >= " + std::to_string(min));
    }
    return static_cast<uint32_t>(value);
}

std::optional<uint32_t> checked_u32(const std::optional<int64_t>& value, int64_t min,
                                    const char* flag) {
    if (!value) return std::nullopt;
    return checked_u32(*value, min, flag);
}

bool is_within(const fs::path& path, const fs::path& dir) {
    auto rel = path.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

}  // namespace

RenderInputs RenderInputs::from_artifacts(const ArtifactPaths& artifacts) {
    return {artifacts.script, artifacts.timeline, artifacts.audio};
}

RenderRequest RenderHandoff::build_request(const RenderInputs& inputs,
                                           const RenderOptions& options,
                                           const fs::path& cwd) const {
    RenderRequest request;

    // Numbers first: nothing is read when the invocation is malformed
    request.start_frame     = checked_u32(options.start_frame, 0, "--start");
    request.end_frame       = checked_u32(options.end_frame, 0, "--end");
    request.workers         = checked_u32(options.workers, 1, "--workers");
    request.width           = checked_u32(options.width, 1, "--width");
    request.height          = checked_u32(options.height, 1, "--height");
    request.duration_frames = checked_u32(options.duration_frames, 1, "--duration");

    if (request.end_frame && *request.end_frame < request.start_frame) {
        throw ValidationError("--end must not be before --start");
    }
    if (!(options.scale > 0.0)) {
        throw ValidationError("--scale must be positive");
    }
    if (options.fps && !(*options.fps > 0.0)) {
        throw ValidationError("--fps must be positive");
    }
    if (options.frame_pattern.empty()) {
        throw ValidationError("--pattern must not be empty");
    }
    if (options.frames_dir.empty() || options.output_path.empty()) {
        throw ValidationError("Render requires both a frames directory and an output path");
    }

    request.frames_dir  = absolute_from(cwd, options.frames_dir);
    request.output_path = absolute_from(cwd, options.output_path);
    auto script_path = absolute_from(cwd, inputs.script);
    std::optional<fs::path> timeline_path, audio_path;
    if (inputs.timeline) timeline_path = absolute_from(cwd, *inputs.timeline);
    if (inputs.audio)    audio_path    = absolute_from(cwd, *inputs.audio);

    if (options.clean_frames) {
        auto guard = [&](const fs::path& path, const char* what) {
            if (is_within(path, request.frames_dir)) {
                throw ValidationError(std::string(what) + " " + path.string() +
                                      " lies inside the frames directory that would be cleaned");
            }
        };
        guard(request.output_path, "Output");
        guard(cwd, "Working directory");
        guard(script_path, "Script");
        if (timeline_path) guard(*timeline_path, "Timeline");
        if (audio_path)    guard(*audio_path, "Audio");
    }

    if (!fs::is_regular_file(script_path)) {
        throw MissingArtifactError(script_path);
    }
    request.script = load_json(script_path, "script");

    if (timeline_path) {
        if (!fs::is_regular_file(*timeline_path)) {
            throw NotFoundError("Timeline not found: " + timeline_path->string());
        }
        request.timeline = load_json(*timeline_path, "timeline");
    }

    if (audio_path) {
        if (!fs::is_regular_file(*audio_path)) {
            throw NotFoundError("Audio not found: " + audio_path->string());
        }
        request.audio_path = audio_path;
    }

    if (options.browser_bundle) {
        request.browser_bundle = absolute_from(cwd, *options.browser_bundle);
    }

    request.title               = options.title;
    request.subtitle            = options.subtitle;
    request.debug_layout        = options.debug_layout;
    request.frame_pattern       = options.frame_pattern;
    request.device_scale_factor = options.scale;
    request.encoder_path        = options.ffmpeg;
    request.encoder_args        = options.ffmpeg_args;
    request.fps                 = options.fps;
    request.clean_frames        = options.clean_frames;
    return request;
}

fs::path RenderHandoff::build_and_render(const RenderInputs& inputs,
                                         const RenderOptions& options,
                                         const fs::path& cwd) {
    auto request = build_request(inputs, options, cwd);

    if (request.clean_frames) {
        clean_frames_dir(request.frames_dir, request.frame_pattern);
    } else {
        fs::create_directories(request.frames_dir);
    }

    spdlog::info("Rendering frames into {} (renderer: {})",
                 request.frames_dir.string(), renderer_.name());
    auto frames = renderer_.render_frames(request);
    spdlog::info("Rendered frames {}..{} at {} fps",
                 frames.start_frame, frames.end_frame, request.fps.value_or(frames.fps));

    encoder_.encode(request, frames);
    return request.output_path;
}

bool matches_frame_pattern(const std::string& name, const std::string& pattern) {
    auto percent = pattern.find('%');
    if (percent == std::string::npos) return name == pattern;

    // %d, %6d or %06d
    auto spec_end = percent + 1;
    while (spec_end < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[spec_end]))) {
        ++spec_end;
    }
    if (spec_end >= pattern.size() || pattern[spec_end] != 'd') return name == pattern;

    auto prefix = pattern.substr(0, percent);
    auto suffix = pattern.substr(spec_end + 1);
    if (name.size() <= prefix.size() + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    auto digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    return std::all_of(digits.begin(), digits.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

void clean_frames_dir(const fs::path& frames_dir, const std::string& frame_pattern) {
    if (!fs::exists(frames_dir)) {
        fs::create_directories(frames_dir);
        return;
    }

    size_t removed = 0;
    for (const auto& entry : fs::directory_iterator(frames_dir)) {
        if (entry.is_symlink() || !entry.is_regular_file()) continue;
        if (!matches_frame_pattern(entry.path().filename().string(), frame_pattern)) continue;
        fs::remove(entry.path());
        ++removed;
    }
    spdlog::debug("Cleaned {} frames from {}", removed, frames_dir.string());
}

}  // namespace videoml
