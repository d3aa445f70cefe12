// About: Built-in collaborator adapters. The loader, generator and renderer
// are external programs driven over a JSON file/stdout protocol; the encoder
// is ffmpeg.
#pragma once

#include <string>
#include <vector>

#include "videoml/adapters/adapter.h"
#include "videoml/core/config.h"

namespace videoml::adapters {

/// `<argv...> <source>` prints `{"compositions": [{"id": ...}, ...]}`.
class ProcessCompositionLoader : public CompositionLoader {
public:
    explicit ProcessCompositionLoader(std::vector<std::string> argv) : argv_(std::move(argv)) {}

    [[nodiscard]] std::string name() const override { return "process"; }
    std::vector<CompositionUnit> load(const SourcePath& source) override;

    /// Parse the loader's stdout document.
    static std::vector<CompositionUnit> parse_output(const std::string& output,
                                                     const SourcePath& source);

private:
    std::vector<std::string> argv_;
};

/// Writes the request to `<out_dir>/generate-request.json` and runs
/// `<argv...> <request file>`; stdout lines go to the request's log sink.
class ProcessGenerator : public CompositionGenerator {
public:
    explicit ProcessGenerator(std::vector<std::string> argv) : argv_(std::move(argv)) {}

    [[nodiscard]] std::string name() const override { return "process"; }
    void generate(const GenerationRequest& request) override;

private:
    std::vector<std::string> argv_;
};

/// Writes the request next to the frames directory and runs
/// `<argv...> <request file>`; the last stdout line is the FrameSequence.
class ProcessFrameRenderer : public FrameRenderer {
public:
    explicit ProcessFrameRenderer(std::vector<std::string> argv) : argv_(std::move(argv)) {}

    [[nodiscard]] std::string name() const override { return "process"; }
    FrameSequence render_frames(const RenderRequest& request) override;

private:
    std::vector<std::string> argv_;
};

class FfmpegEncoder : public VideoEncoder {
public:
    [[nodiscard]] std::string name() const override { return "ffmpeg"; }
    void encode(const RenderRequest& request, const FrameSequence& frames) override;
};

/// Full ffmpeg argv: required arguments, then the caller's extra
/// arguments in order, then the output path.
[[nodiscard]] std::vector<std::string> encoder_arguments(const RenderRequest& request,
                                                         const FrameSequence& frames);

/// Register the process adapters configured by `tooling` and ffmpeg, for
/// each collaborator kind that has no adapter registered yet.
void register_builtin_adapters(const ToolingConfig& tooling);

}  // namespace videoml::adapters
