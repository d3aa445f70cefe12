// About: Default artifact locations for a composition and the per-field
// override precedence (override ?? default).
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "videoml/core/types.h"

namespace videoml {

namespace fs = std::filesystem;

using RootFinder = std::function<fs::path(const fs::path& source)>;

/// Defaults for `id` under `root`:
///   script   <root>/src/videos/<id>/<id>.script.json
///   timeline <root>/src/videos/<id>/<id>.timeline.json
///   audio    <root>/public/videoml/<id>.wav
///   out_dir  <root>/.videoml/out/<id>
[[nodiscard]] ArtifactPaths default_artifact_paths(const fs::path& root, const std::string& id);

/// Each field independently takes the override when present.
[[nodiscard]] ArtifactPaths apply_overrides(ArtifactPaths defaults,
                                            const ArtifactOverrides& overrides);

/// Artifact paths for one composition. The root is `project_dir` when
/// given, otherwise `find_root(source)` (find_project_root by default).
[[nodiscard]] ArtifactPaths derive_artifact_paths(const std::string& composition_id,
                                                  const SourcePath& source,
                                                  const std::optional<fs::path>& project_dir,
                                                  const ArtifactOverrides& overrides,
                                                  const RootFinder& find_root = {});

/// `<project or cwd>/public/videoml/<id>.mp4`
[[nodiscard]] fs::path default_video_path(const std::optional<fs::path>& project_dir,
                                          const fs::path& cwd,
                                          const std::string& composition_id);

}  // namespace videoml
