#include "videoml/core/types.h"

#include <numeric>

namespace videoml {

fs::path absolute_from(const fs::path& base, const fs::path& path) {
    if (path.is_absolute()) return path.lexically_normal();
    return (fs::absolute(base) / path).lexically_normal();
}

size_t total_compositions(const std::vector<SourceRun>& runs) {
    return std::accumulate(runs.begin(), runs.end(), size_t{0},
        [](size_t sum, const SourceRun& r) { return sum + r.compositions.size(); });
}

// ─── JSON serialization ────────────────────────────────────────────

void to_json(nlohmann::json& j, const CompositionUnit& c) {
    j = c.spec.is_object() ? c.spec : nlohmann::json::object();
    j["id"] = c.id;
}

void from_json(const nlohmann::json& j, CompositionUnit& c) {
    c.id   = j.at("id").get<std::string>();
    c.spec = j;
}

void to_json(nlohmann::json& j, const ArtifactPaths& a) {
    j = {
        {"script",   a.script.string()},
        {"timeline", a.timeline.string()},
        {"audio",    a.audio.string()},
        {"out_dir",  a.out_dir.string()},
    };
}

void from_json(const nlohmann::json& j, FrameSequence& f) {
    f.fps         = j.value("fps", f.fps);
    f.width       = j.value("width", f.width);
    f.height      = j.value("height", f.height);
    f.start_frame = j.value("start_frame", f.start_frame);
    f.end_frame   = j.value("end_frame", f.end_frame);
    f.frame_count = j.value("frame_count",
        f.end_frame >= f.start_frame ? f.end_frame - f.start_frame + 1 : 0u);
}

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json optional_path(const std::optional<fs::path>& p) {
    return p ? nlohmann::json(p->string()) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json GenerationRequest::to_json() const {
    nlohmann::json j;
    j["composition"] = composition;
    j["source"]      = source.string();
    j["artifacts"]   = artifacts;
    j["config"]      = config.is_null() ? nlohmann::json::object() : config;

    nlohmann::json o;
    o["provider"]       = optional_json(options.provider);
    o["sfx_provider"]   = optional_json(options.sfx_provider);
    o["music_provider"] = optional_json(options.music_provider);
    o["seed"]           = optional_json(options.seed);
    o["environment"]    = optional_json(options.environment);
    o["fresh"]          = options.fresh;
    o["verbose"]        = options.verbose;
    switch (options.usage.mode) {
        case UsageLedger::Mode::Default:  o["usage"] = "default"; break;
        case UsageLedger::Mode::Path:     o["usage"] = options.usage.path.string(); break;
        case UsageLedger::Mode::Disabled: o["usage"] = nullptr; break;
    }
    j["options"] = o;
    return j;
}

nlohmann::json RenderRequest::to_json() const {
    nlohmann::json j;
    j["script"]              = script;
    j["timeline"]            = timeline ? *timeline : nlohmann::json(nullptr);
    j["title"]               = optional_json(title);
    j["subtitle"]            = optional_json(subtitle);
    j["debug_layout"]        = debug_layout;
    j["frames_dir"]          = frames_dir.string();
    j["output_path"]         = output_path.string();
    j["audio_path"]          = optional_path(audio_path);
    j["frame_pattern"]       = frame_pattern;
    j["start_frame"]         = start_frame;
    j["end_frame"]           = optional_json(end_frame);
    j["device_scale_factor"] = device_scale_factor;
    j["workers"]             = optional_json(workers);
    j["browser_bundle"]      = optional_path(browser_bundle);
    j["fps"]                 = optional_json(fps);
    j["width"]               = optional_json(width);
    j["height"]              = optional_json(height);
    j["duration_frames"]     = optional_json(duration_frames);
    return j;
}

}  // namespace videoml
