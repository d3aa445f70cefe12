#include "videoml/pipeline/artifact_paths.h"

#include "videoml/core/config.h"

namespace videoml {

ArtifactPaths default_artifact_paths(const fs::path& root, const std::string& id) {
    ArtifactPaths paths;
    paths.script   = root / "src" / "videos" / id / (id + ".script.json");
    paths.timeline = root / "src" / "videos" / id / (id + ".timeline.json");
    paths.audio    = root / "public" / "videoml" / (id + ".wav");
    paths.out_dir  = root / ".videoml" / "out" / id;
    return paths;
}

ArtifactPaths apply_overrides(ArtifactPaths defaults, const ArtifactOverrides& overrides) {
    if (overrides.script)   defaults.script   = *overrides.script;
    if (overrides.timeline) defaults.timeline = *overrides.timeline;
    if (overrides.audio)    defaults.audio    = *overrides.audio;
    if (overrides.out_dir)  defaults.out_dir  = *overrides.out_dir;
    return defaults;
}

ArtifactPaths derive_artifact_paths(const std::string& composition_id,
                                    const SourcePath& source,
                                    const std::optional<fs::path>& project_dir,
                                    const ArtifactOverrides& overrides,
                                    const RootFinder& find_root) {
    fs::path root;
    if (project_dir)    root = *project_dir;
    else if (find_root) root = find_root(source);
    else                root = find_project_root(source);

    return apply_overrides(default_artifact_paths(root, composition_id), overrides);
}

fs::path default_video_path(const std::optional<fs::path>& project_dir,
                            const fs::path& cwd,
                            const std::string& composition_id) {
    auto base = project_dir ? *project_dir : cwd;
    return base / "public" / "videoml" / (composition_id + ".mp4");
}

}  // namespace videoml
