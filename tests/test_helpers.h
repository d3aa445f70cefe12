// Temp directories, file writers and in-memory collaborators for tests.
// Nothing here spawns processes.
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "videoml/adapters/adapter.h"
#include "videoml/core/types.h"

namespace videoml::test {

// ─── Filesystem ───────────────────────────────────────────────────

// RAII temp directory that cleans up on destruction
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path()
            / ("videoml_test_" + std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count())
               + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
        path = std::filesystem::canonical(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

// Write `content` to `path`, creating parent directories.
inline std::filesystem::path write_file(const std::filesystem::path& path,
                                        const std::string& content = "") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline CompositionUnit make_unit(const std::string& id) {
    return {id, nlohmann::json{{"id", id}}};
}

// ─── Fake Collaborators ───────────────────────────────────────────

// Returns canned compositions per source; unknown sources throw.
class FakeLoader : public CompositionLoader {
public:
    std::map<fs::path, std::vector<std::string>> ids;

    [[nodiscard]] std::string name() const override { return "fake"; }

    std::vector<CompositionUnit> load(const SourcePath& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        loaded_.push_back(source);
        auto it = ids.find(source);
        if (it == ids.end()) {
            throw std::runtime_error("fake loader: unknown source " + source.string());
        }
        std::vector<CompositionUnit> units;
        for (const auto& id : it->second) units.push_back(make_unit(id));
        return units;
    }

    // Every source passed to load(), in call order
    std::vector<SourcePath> loaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return loaded_;
    }

    std::atomic<int> calls{0};

private:
    mutable std::mutex          mutex_;
    std::vector<SourcePath>     loaded_;
};

// Records every request; optionally fails on one composition id and
// tracks how many generate() calls overlap.
class RecordingGenerator : public CompositionGenerator {
public:
    std::string                 fail_on;
    std::chrono::milliseconds   delay{0};

    [[nodiscard]] std::string name() const override { return "recording"; }

    void generate(const GenerationRequest& request) override {
        int now = ++active_;
        int seen = max_active_.load();
        while (now > seen && !max_active_.compare_exchange_weak(seen, now)) {}

        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        --active_;

        if (!fail_on.empty() && request.composition.id == fail_on) {
            throw std::runtime_error("generation failed for " + fail_on);
        }
    }

    std::vector<GenerationRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<std::string> generated_ids() const {
        std::vector<std::string> ids;
        for (const auto& r : requests()) ids.push_back(r.composition.id);
        return ids;
    }

    size_t call_count() const { return requests().size(); }
    int    max_concurrency() const { return max_active_.load(); }

private:
    mutable std::mutex              mutex_;
    std::vector<GenerationRequest>  requests_;
    std::atomic<int>                active_{0};
    std::atomic<int>                max_active_{0};
};

// Writes nothing; reports the frames the request asked for.
class FakeRenderer : public FrameRenderer {
public:
    std::vector<RenderRequest> requests;

    [[nodiscard]] std::string name() const override { return "fake"; }

    FrameSequence render_frames(const RenderRequest& request) override {
        requests.push_back(request);
        FrameSequence frames;
        frames.fps         = request.fps.value_or(30.0);
        frames.width       = request.width.value_or(1280);
        frames.height      = request.height.value_or(720);
        frames.start_frame = request.start_frame;
        frames.end_frame   = request.end_frame.value_or(request.start_frame + 9);
        frames.frame_count = frames.end_frame - frames.start_frame + 1;
        return frames;
    }
};

// Touches the output file so callers can check it was "encoded".
class FakeEncoder : public VideoEncoder {
public:
    std::vector<FrameSequence> encoded;

    [[nodiscard]] std::string name() const override { return "fake"; }

    void encode(const RenderRequest& request, const FrameSequence& frames) override {
        encoded.push_back(frames);
        write_file(request.output_path, "mp4");
    }
};

// ─── Waiting ──────────────────────────────────────────────────────

inline bool eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

}  // namespace videoml::test
