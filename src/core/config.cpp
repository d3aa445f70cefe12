#include "videoml/core/config.h"

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

namespace {

bool has_project_marker(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir / ".videoml", ec)
        || fs::is_directory(dir / ".babulus", ec)
        || fs::is_regular_file(dir / "package.json", ec);
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const auto& text = node.Scalar();
    // Quoted scalars carry the non-specific "!" tag and stay strings
    if (node.Tag() == "!") return text;

    if (text == "~" || text == "null" || text.empty()) return nullptr;

    bool b;
    if (YAML::convert<bool>::decode(node, b)) return b;

    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) return i;

    double d;
    if (YAML::convert<double>::decode(node, d)) return d;

    return text;
}

std::vector<std::string> parse_command(const YAML::Node& node,
                                       std::vector<std::string> fallback,
                                       const std::string& key) {
    if (!node) return fallback;
    std::vector<std::string> argv;
    if (node.IsScalar()) {
        argv.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& part : node) argv.push_back(part.as<std::string>());
    }
    if (argv.empty()) {
        throw ValidationError("Config 'tooling." + key + "' must be a command or a list of arguments");
    }
    return argv;
}

}  // namespace

fs::path find_project_root(const fs::path& start) {
    auto origin = fs::absolute(start).lexically_normal();
    std::error_code ec;
    if (!fs::is_directory(origin, ec)) origin = origin.parent_path();

    for (auto dir = origin; ; dir = dir.parent_path()) {
        if (has_project_marker(dir)) return dir;
        if (dir == dir.root_path() || dir.parent_path() == dir) break;
    }
    return origin;
}

std::optional<fs::path> find_config_path(const fs::path& root) {
    std::error_code ec;
    for (const auto& rel : config_candidates()) {
        auto candidate = root / rel;
        if (fs::is_regular_file(candidate, ec)) return candidate.lexically_normal();
    }
    return std::nullopt;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                obj[it->first.as<std::string>()] = yaml_to_json(it->second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

// ─── ProjectConfig ─────────────────────────────────────────────────

ProjectConfig ProjectConfig::from_file(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw NotFoundError("Config file not found: " + config_path.string());
    }
    YAML::Node raw;
    try {
        raw = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception& e) {
        throw ValidationError("Invalid config " + config_path.string() + ": " + e.what());
    }
    auto config = from_string(YAML::Dump(raw));
    config.path = config_path;
    return config;
}

ProjectConfig ProjectConfig::from_string(const std::string& yaml_str) {
    ProjectConfig config;
    config.raw = YAML::Load(yaml_str);

    if (config.raw.IsNull()) return config;
    if (!config.raw.IsMap()) {
        throw ValidationError("Config must be a YAML mapping");
    }

    config.settings = yaml_to_json(config.raw);

    if (auto tooling = config.raw["tooling"]) {
        config.tooling.loader    = parse_command(tooling["loader"], config.tooling.loader, "loader");
        config.tooling.generator = parse_command(tooling["generator"], config.tooling.generator, "generator");
        config.tooling.renderer  = parse_command(tooling["renderer"], config.tooling.renderer, "renderer");
    }

    return config;
}

ProjectConfig ProjectConfig::discover(const std::optional<fs::path>& project_dir,
                                      const fs::path& source) {
    auto root = project_dir ? *project_dir : find_project_root(source);
    auto path = find_config_path(root);
    if (!path) {
        spdlog::debug("No config file under {}, using defaults", root.string());
        return {};
    }
    spdlog::debug("Using config {}", path->string());
    return from_file(*path);
}

}  // namespace videoml
