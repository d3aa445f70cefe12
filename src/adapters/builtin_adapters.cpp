#include "videoml/adapters/process_adapters.h"

#include <fstream>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "videoml/core/errors.h"
#include "videoml/core/process.h"

namespace videoml::adapters {

namespace {

void write_request(const fs::path& path, const nlohmann::json& request) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write request file: " + path.string());
    }
    out << request.dump(2) << "\n";
}

std::vector<std::string> with_arg(std::vector<std::string> argv, const std::string& arg) {
    argv.push_back(arg);
    return argv;
}

void check_exit(const std::string& collaborator, const std::vector<std::string>& argv,
                const CommandResult& result) {
    if (!result.ok()) {
        throw CollaboratorError(collaborator,
            "'" + join_command(argv) + "' exited with status " +
            std::to_string(result.exit_status));
    }
}

}  // namespace

// ─── Loader ────────────────────────────────────────────────────────

std::vector<CompositionUnit> ProcessCompositionLoader::load(const SourcePath& source) {
    auto argv = with_arg(argv_, source.string());
    auto result = run_command(argv);
    check_exit("loader", argv, result);
    return parse_output(result.output, source);
}

std::vector<CompositionUnit> ProcessCompositionLoader::parse_output(const std::string& output,
                                                                    const SourcePath& source) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(output);
    } catch (const nlohmann::json::parse_error& e) {
        throw CollaboratorError("loader",
            "invalid output for " + source.string() + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("compositions") || !doc["compositions"].is_array()) {
        throw CollaboratorError("loader",
            "output for " + source.string() + " has no 'compositions' array");
    }

    std::vector<CompositionUnit> units;
    for (const auto& entry : doc["compositions"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            throw CollaboratorError("loader",
                "composition without a string 'id' in " + source.string());
        }
        units.push_back(entry.get<CompositionUnit>());
    }
    return units;
}

// ─── Generator ─────────────────────────────────────────────────────

void ProcessGenerator::generate(const GenerationRequest& request) {
    auto request_path = request.artifacts.out_dir / "generate-request.json";
    write_request(request_path, request.to_json());

    EnvOverrides env;
    if (request.options.environment) {
        env.emplace_back("VIDEOML_ENV", *request.options.environment);
    }

    auto argv = with_arg(argv_, request_path.string());
    auto result = run_command(argv, [&](const std::string& line) {
        if (request.log && !line.empty()) request.log(line);
    }, env);
    check_exit("generator", argv, result);
}

// ─── Renderer ──────────────────────────────────────────────────────

FrameSequence ProcessFrameRenderer::render_frames(const RenderRequest& request) {
    auto request_path = request.frames_dir.parent_path() /
        (request.frames_dir.filename().string() + ".render-request.json");
    write_request(request_path, request.to_json());

    std::string last_line;
    auto argv = with_arg(argv_, request_path.string());
    auto result = run_command(argv, [&](const std::string& line) {
        if (line.empty()) return;
        if (!last_line.empty()) spdlog::info("  {}", last_line);
        last_line = line;
    });
    check_exit("renderer", argv, result);

    try {
        return nlohmann::json::parse(last_line).get<FrameSequence>();
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorError("renderer",
            "expected a frame summary as the last output line: " + std::string(e.what()));
    }
}

// ─── Encoder ───────────────────────────────────────────────────────

std::vector<std::string> encoder_arguments(const RenderRequest& request,
                                           const FrameSequence& frames) {
    const double fps = request.fps.value_or(frames.fps);

    std::vector<std::string> argv = {
        request.encoder_path.string(),
        "-y", "-hide_banner", "-loglevel", "error",
        "-framerate", fmt::format("{}", fps),
        "-start_number", std::to_string(frames.start_frame),
        "-i", (request.frames_dir / request.frame_pattern).string(),
    };

    if (request.audio_path) {
        argv.insert(argv.end(), {"-i", request.audio_path->string(), "-map", "0:v", "-map", "1:a"});
    }
    if (frames.frame_count > 0) {
        argv.insert(argv.end(), {"-frames:v", std::to_string(frames.frame_count)});
    }
    argv.insert(argv.end(), {"-pix_fmt", "yuv420p"});

    argv.insert(argv.end(), request.encoder_args.begin(), request.encoder_args.end());
    argv.push_back(request.output_path.string());
    return argv;
}

void FfmpegEncoder::encode(const RenderRequest& request, const FrameSequence& frames) {
    fs::create_directories(request.output_path.parent_path());

    auto argv = encoder_arguments(request, frames);
    spdlog::info("Encoding {} frame(s) -> {}", frames.frame_count, request.output_path.string());
    auto result = run_command(argv, [](const std::string& line) {
        spdlog::debug("  ffmpeg: {}", line);
    });
    check_exit("ffmpeg", argv, result);
}

// ─── Registration ──────────────────────────────────────────────────

void register_builtin_adapters(const ToolingConfig& tooling) {
    auto& mgr = AdapterManager::instance();
    if (!mgr.find_loader())
        mgr.register_loader(std::make_unique<ProcessCompositionLoader>(tooling.loader));
    if (!mgr.find_generator())
        mgr.register_generator(std::make_unique<ProcessGenerator>(tooling.generator));
    if (!mgr.find_renderer())
        mgr.register_renderer(std::make_unique<ProcessFrameRenderer>(tooling.renderer));
    if (!mgr.find_encoder())
        mgr.register_encoder(std::make_unique<FfmpegEncoder>());
}

}  // namespace videoml::adapters
