// About: Project configuration: project-root discovery, config-file
// discovery, and the YAML config that is forwarded to the generator and
// names the collaborator commands.
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace videoml {

namespace fs = std::filesystem;

/// Config locations relative to the project root, in lookup order.
inline const std::vector<fs::path>& config_candidates() {
    static const std::vector<fs::path> candidates = {
        fs::path(".videoml") / "config.yml",
        fs::path(".babulus") / "config.yml",
    };
    return candidates;
}

/// Walk upward from a source file (or directory) to the nearest directory
/// holding `.videoml/`, `.babulus/` or `package.json`. Falls back to the
/// starting directory when no marker exists.
[[nodiscard]] fs::path find_project_root(const fs::path& start);

/// First existing config candidate under `root`, if any.
[[nodiscard]] std::optional<fs::path> find_config_path(const fs::path& root);

/// Convert a YAML document to JSON. Unquoted scalars become numbers or
/// booleans where they parse as such.
[[nodiscard]] nlohmann::json yaml_to_json(const YAML::Node& node);

// ─── Tooling ───────────────────────────────────────────────────────

/// argv prefixes of the external collaborators.
struct ToolingConfig {
    std::vector<std::string>    loader{"vml-load"};
    std::vector<std::string>    generator{"vml-generate"};
    std::vector<std::string>    renderer{"vml-frames"};

    bool operator==(const ToolingConfig&) const = default;
};

// ─── Project Configuration ─────────────────────────────────────────

struct ProjectConfig {
    std::optional<fs::path>     path;       // file it was read from
    nlohmann::json              settings = nlohmann::json::object();
    ToolingConfig               tooling;
    YAML::Node                  raw;

    static ProjectConfig from_file(const fs::path& config_path);
    static ProjectConfig from_string(const std::string& yaml_str);

    /// Discover and load the config for a project. `project_dir` wins over
    /// walking up from `source`; a project without a config file yields
    /// defaults.
    static ProjectConfig discover(const std::optional<fs::path>& project_dir,
                                  const fs::path& source);
};

}  // namespace videoml
