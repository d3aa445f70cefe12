// About: Core data types for videoml: source runs, composition units,
// artifact paths, generation and render requests that flow between the
// orchestrator and its external collaborators.
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace videoml {

namespace fs = std::filesystem;

// ─── Sources ───────────────────────────────────────────────────────

/// Absolute, lexically normalized path to a composition source file.
using SourcePath = fs::path;

/// Normalize a path against a base directory (absolute + lexically_normal).
[[nodiscard]] fs::path absolute_from(const fs::path& base, const fs::path& path);

/// One named composition inside a source file. The spec payload is
/// opaque to the orchestrator and forwarded to the generator as-is.
struct CompositionUnit {
    std::string     id;
    nlohmann::json  spec;
};

struct SourceRun {
    SourcePath                      source;
    std::vector<CompositionUnit>    compositions;   // declaration order
};

[[nodiscard]] size_t total_compositions(const std::vector<SourceRun>& runs);

// ─── Artifacts ─────────────────────────────────────────────────────

struct ArtifactPaths {
    fs::path    script;
    fs::path    timeline;
    fs::path    audio;
    fs::path    out_dir;
};

struct ArtifactOverrides {
    std::optional<fs::path>     script;
    std::optional<fs::path>     timeline;
    std::optional<fs::path>     audio;
    std::optional<fs::path>     out_dir;

    [[nodiscard]] bool any() const {
        return script || timeline || audio || out_dir;
    }
};

// ─── Generation ────────────────────────────────────────────────────

/// Usage ledger destination: collaborator default, explicit file, or off.
struct UsageLedger {
    enum class Mode { Default, Path, Disabled };

    Mode        mode{Mode::Default};
    fs::path    path;

    static UsageLedger at(fs::path p) { return {Mode::Path, std::move(p)}; }
    static UsageLedger disabled()     { return {Mode::Disabled, {}}; }
};

struct GenerationOptions {
    std::optional<std::string>  provider;
    std::optional<std::string>  sfx_provider;
    std::optional<std::string>  music_provider;
    std::optional<int64_t>      seed;
    std::optional<std::string>  environment;    // provider-selection environment
    UsageLedger                 usage;
    bool                        fresh{false};
    bool                        verbose{true};
};

using LogSink = std::function<void(const std::string& message)>;

struct GenerationRequest {
    CompositionUnit     composition;
    SourcePath          source;
    ArtifactPaths       artifacts;
    nlohmann::json      config;
    GenerationOptions   options;
    LogSink             log;        // empty when quiet

    /// Deterministic wire form (no timestamps, stable key order).
    [[nodiscard]] nlohmann::json to_json() const;
};

// ─── Rendering ─────────────────────────────────────────────────────

struct RenderRequest {
    nlohmann::json                  script;
    std::optional<nlohmann::json>   timeline;
    std::optional<std::string>      title;
    std::optional<std::string>      subtitle;
    bool                            debug_layout{false};

    fs::path                        frames_dir;     // absolute
    fs::path                        output_path;    // absolute
    std::optional<fs::path>         audio_path;
    std::string                     frame_pattern{"frame-%06d.png"};

    uint32_t                        start_frame{0};
    std::optional<uint32_t>         end_frame;      // inclusive; renderer infers when unset
    double                          device_scale_factor{1.0};
    std::optional<uint32_t>         workers;        // renderer chooses when unset
    std::optional<fs::path>         browser_bundle;

    fs::path                        encoder_path{"ffmpeg"};
    std::vector<std::string>        encoder_args;   // opaque, appended in order

    std::optional<double>           fps;
    std::optional<uint32_t>         width;
    std::optional<uint32_t>         height;
    std::optional<uint32_t>         duration_frames;

    bool                            clean_frames{true};

    [[nodiscard]] nlohmann::json to_json() const;
};

/// What the frame renderer actually produced.
struct FrameSequence {
    double      fps{30.0};
    uint32_t    width{0};
    uint32_t    height{0};
    uint32_t    start_frame{0};
    uint32_t    end_frame{0};
    uint32_t    frame_count{0};
};

void to_json(nlohmann::json& j, const CompositionUnit& c);
void from_json(const nlohmann::json& j, CompositionUnit& c);
void to_json(nlohmann::json& j, const ArtifactPaths& a);
void from_json(const nlohmann::json& j, FrameSequence& f);

}  // namespace videoml
