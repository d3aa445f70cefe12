// About: Watch engine: classifies filesystem change events, collapses
// bursts within a debounce window, and runs rebuilds through a single-flight
// queue so two rebuilds never touch the same artifacts at once.
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <stop_token>
#include <thread>
#include <vector>

#include "videoml/core/types.h"
#include "videoml/pipeline/generation.h"

namespace videoml {

namespace fs = std::filesystem;

enum class ChangeKind {
    Irrelevant,
    SourceChange,   // a tracked source itself: rebuild that source
    SharedChange,   // another .ts/.xml next to the sources: rebuild all
    ConfigChange,   // the project config: rebuild all
};

enum class WatchState {
    Idle,
    Watching,
    Rebuilding,
};

[[nodiscard]] std::string change_kind_to_string(ChangeKind kind);
[[nodiscard]] std::string watch_state_to_string(WatchState state);

// ─── Watch Session ─────────────────────────────────────────────────

/// Paths fixed at startup. Sources created later are not picked up.
class WatchSession {
public:
    WatchSession(const std::vector<SourcePath>& sources, std::optional<fs::path> config_path);

    [[nodiscard]] ChangeKind classify(const fs::path& changed) const;

    [[nodiscard]] const std::vector<fs::path>&   watched_directories() const { return watched_dirs_; }
    [[nodiscard]] const std::vector<fs::path>&   source_directories()  const { return source_dirs_; }
    [[nodiscard]] const std::vector<SourcePath>& sources()             const { return sources_; }
    [[nodiscard]] const std::optional<fs::path>& config_path()         const { return config_path_; }

private:
    std::vector<SourcePath>     sources_;
    std::vector<fs::path>       source_dirs_;
    std::vector<fs::path>       watched_dirs_;
    std::optional<fs::path>     config_path_;
};

// ─── Rebuild Trigger ───────────────────────────────────────────────

/// Union of the changes observed since the last rebuild started.
struct RebuildTrigger {
    bool                    full{false};
    std::set<SourcePath>    sources;

    void merge(ChangeKind kind, const fs::path& path);
    void merge(const RebuildTrigger& other);

    [[nodiscard]] bool        empty() const { return !full && sources.empty(); }
    [[nodiscard]] SourceScope scope() const;
};

// ─── Watch Engine ──────────────────────────────────────────────────

using RebuildFn = std::function<void(const SourceScope& scope)>;

class WatchEngine {
public:
    static constexpr std::chrono::milliseconds kDefaultDebounce{500};

    WatchEngine(WatchSession session, RebuildFn rebuild,
                std::chrono::milliseconds debounce = kDefaultDebounce);
    ~WatchEngine();

    WatchEngine(const WatchEngine&) = delete;
    WatchEngine& operator=(const WatchEngine&) = delete;

    /// Start the rebuild worker. State becomes Watching.
    void start();

    /// Stop the worker after any in-flight rebuild. State becomes Idle.
    void stop();

    /// Feed one filesystem event. Never blocks on a running rebuild.
    /// Returns the classification.
    ChangeKind notify(const fs::path& changed);

    /// Queue a full rebuild, e.g. the initial build of a session.
    void request_full_rebuild();

    /// Block until nothing is pending or running, or the timeout expires.
    bool wait_until_quiet(std::chrono::milliseconds timeout);

    [[nodiscard]] WatchState state() const;
    [[nodiscard]] size_t     rebuild_count() const;
    [[nodiscard]] const WatchSession& session() const { return session_; }

private:
    WatchSession                        session_;
    RebuildFn                           rebuild_;
    std::chrono::milliseconds           debounce_;

    mutable std::mutex                  mutex_;
    std::condition_variable_any         wake_;
    std::condition_variable_any         quiet_;
    RebuildTrigger                      pending_;
    std::chrono::steady_clock::time_point last_event_{};
    WatchState                          state_{WatchState::Idle};
    size_t                              rebuilds_{0};
    std::jthread                        worker_;

    void enqueue(const RebuildTrigger& trigger);
    void run(std::stop_token stop);
};

}  // namespace videoml
