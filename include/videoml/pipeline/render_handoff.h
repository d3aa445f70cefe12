// About: Render handoff: loads the generated script/timeline, assembles a
// RenderRequest with absolute paths and forwards it to the frame renderer
// and encoder.
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "videoml/adapters/adapter.h"
#include "videoml/core/types.h"

namespace videoml {

namespace fs = std::filesystem;

/// Artifacts a render consumes. Relative paths resolve against cwd.
struct RenderInputs {
    fs::path                    script;
    std::optional<fs::path>     timeline;
    std::optional<fs::path>     audio;

    static RenderInputs from_artifacts(const ArtifactPaths& artifacts);
};

/// Render knobs as given on the command line. Signed so that negative
/// input is reported instead of wrapping.
struct RenderOptions {
    fs::path                    frames_dir;
    fs::path                    output_path;
    std::optional<std::string>  title;
    std::optional<std::string>  subtitle;
    bool                        debug_layout{false};
    std::string                 frame_pattern{"frame-%06d.png"};
    int64_t                     start_frame{0};
    std::optional<int64_t>      end_frame;
    double                      scale{1.0};
    std::optional<int64_t>      workers;
    std::optional<fs::path>     browser_bundle;
    fs::path                    ffmpeg{"ffmpeg"};
    std::vector<std::string>    ffmpeg_args;
    std::optional<double>       fps;
    std::optional<int64_t>      width;
    std::optional<int64_t>      height;
    std::optional<int64_t>      duration_frames;
    bool                        clean_frames{true};
};

class RenderHandoff {
public:
    RenderHandoff(FrameRenderer& renderer, VideoEncoder& encoder)
        : renderer_(renderer), encoder_(encoder) {}

    /// Validate options, load the artifacts and resolve paths. No side
    /// effects. Throws MissingArtifactError when the script is absent,
    /// NotFoundError for a missing timeline/audio, ValidationError for bad
    /// numbers or when cleaning would touch the inputs or cwd.
    [[nodiscard]] RenderRequest build_request(const RenderInputs& inputs,
                                              const RenderOptions& options,
                                              const fs::path& cwd) const;

    /// build_request, clean the frames directory if asked, render frames,
    /// encode. Returns the absolute output path.
    fs::path build_and_render(const RenderInputs& inputs,
                              const RenderOptions& options,
                              const fs::path& cwd);

private:
    FrameRenderer&  renderer_;
    VideoEncoder&   encoder_;
};

/// True when `name` is a file the printf-style `pattern` (`frame-%06d.png`)
/// could have produced.
[[nodiscard]] bool matches_frame_pattern(const std::string& name, const std::string& pattern);

/// Delete the frames `frame_pattern` names from `frames_dir`, creating the
/// directory if missing. Other files and subdirectories are left alone.
void clean_frames_dir(const fs::path& frames_dir, const std::string& frame_pattern);

}  // namespace videoml
