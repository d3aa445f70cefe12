#include "videoml/pipeline/watch_engine.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace videoml {

namespace {

bool has_extension(const fs::path& path, std::initializer_list<const char*> exts) {
    auto ext = path.extension().string();
    return std::any_of(exts.begin(), exts.end(), [&](const char* e) { return ext == e; });
}

bool is_under(const fs::path& path, const fs::path& dir) {
    auto rel = path.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != ".." && rel != ".";
}

void push_unique(std::vector<fs::path>& out, const fs::path& p) {
    if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
}

}  // namespace

std::string change_kind_to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Irrelevant:   return "Irrelevant";
        case ChangeKind::SourceChange: return "Source";
        case ChangeKind::SharedChange: return "Shared";
        case ChangeKind::ConfigChange: return "Config";
    }
    return "Unknown";
}

std::string watch_state_to_string(WatchState state) {
    switch (state) {
        case WatchState::Idle:       return "Idle";
        case WatchState::Watching:   return "Watching";
        case WatchState::Rebuilding: return "Rebuilding";
    }
    return "Unknown";
}

// ─── WatchSession ──────────────────────────────────────────────────

WatchSession::WatchSession(const std::vector<SourcePath>& sources,
                           std::optional<fs::path> config_path) {
    for (const auto& s : sources) {
        auto normalized = s.lexically_normal();
        if (std::find(sources_.begin(), sources_.end(), normalized) == sources_.end()) {
            sources_.push_back(normalized);
        }
        push_unique(source_dirs_, normalized.parent_path());
    }

    watched_dirs_ = source_dirs_;
    if (config_path) {
        config_path_ = config_path->lexically_normal();
        push_unique(watched_dirs_, config_path_->parent_path());
    }
}

ChangeKind WatchSession::classify(const fs::path& changed) const {
    auto path = changed.lexically_normal();

    if (!has_extension(path, {".ts", ".xml", ".yml", ".yaml"})) {
        return ChangeKind::Irrelevant;
    }
    if (config_path_ && path == *config_path_) {
        return ChangeKind::ConfigChange;
    }
    if (std::find(sources_.begin(), sources_.end(), path) != sources_.end()) {
        return ChangeKind::SourceChange;
    }
    if (has_extension(path, {".ts", ".xml"})) {
        for (const auto& dir : source_dirs_) {
            if (is_under(path, dir)) return ChangeKind::SharedChange;
        }
    }
    return ChangeKind::Irrelevant;
}

// ─── RebuildTrigger ────────────────────────────────────────────────

void RebuildTrigger::merge(ChangeKind kind, const fs::path& path) {
    switch (kind) {
        case ChangeKind::ConfigChange:
        case ChangeKind::SharedChange:
            full = true;
            break;
        case ChangeKind::SourceChange:
            sources.insert(path.lexically_normal());
            break;
        case ChangeKind::Irrelevant:
            break;
    }
}

void RebuildTrigger::merge(const RebuildTrigger& other) {
    full = full || other.full;
    sources.insert(other.sources.begin(), other.sources.end());
}

SourceScope RebuildTrigger::scope() const {
    if (full) return std::nullopt;
    return sources;
}

// ─── WatchEngine ───────────────────────────────────────────────────

WatchEngine::WatchEngine(WatchSession session, RebuildFn rebuild,
                         std::chrono::milliseconds debounce)
    : session_(std::move(session)), rebuild_(std::move(rebuild)), debounce_(debounce) {}

WatchEngine::~WatchEngine() {
    stop();
}

void WatchEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) return;
    state_  = WatchState::Watching;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void WatchEngine::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = WatchState::Idle;
    quiet_.notify_all();
}

ChangeKind WatchEngine::notify(const fs::path& changed) {
    auto kind = session_.classify(changed);
    if (kind == ChangeKind::Irrelevant) {
        spdlog::trace("Ignoring change: {}", changed.string());
        return kind;
    }

    spdlog::info("CHANGE DETECTED ({}): {}", change_kind_to_string(kind), changed.string());
    RebuildTrigger trigger;
    trigger.merge(kind, changed);
    enqueue(trigger);
    return kind;
}

void WatchEngine::request_full_rebuild() {
    RebuildTrigger trigger;
    trigger.full = true;
    enqueue(trigger);
}

void WatchEngine::enqueue(const RebuildTrigger& trigger) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.merge(trigger);
        last_event_ = std::chrono::steady_clock::now();
    }
    wake_.notify_all();
}

bool WatchEngine::wait_until_quiet(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return quiet_.wait_for(lock, timeout, [this] {
        return pending_.empty() && state_ != WatchState::Rebuilding;
    });
}

WatchState WatchEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t WatchEngine::rebuild_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebuilds_;
}

void WatchEngine::run(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop.stop_requested()) {
        if (!wake_.wait(lock, stop, [this] { return !pending_.empty(); })) break;

        // Debounce: wait until no event has arrived for a full window
        for (;;) {
            auto deadline = last_event_ + debounce_;
            if (std::chrono::steady_clock::now() >= deadline) break;
            wake_.wait_until(lock, stop, deadline, [] { return false; });
            if (stop.stop_requested()) return;
        }

        auto trigger = std::exchange(pending_, RebuildTrigger{});
        state_ = WatchState::Rebuilding;
        lock.unlock();

        if (trigger.full) {
            spdlog::info("Regenerating all compositions...");
        } else {
            spdlog::info("Regenerating {} source(s)...", trigger.sources.size());
        }

        try {
            rebuild_(trigger.scope());
        } catch (const std::exception& e) {
            spdlog::error("Rebuild failed: {}", e.what());
        }

        lock.lock();
        ++rebuilds_;
        state_ = WatchState::Watching;
        quiet_.notify_all();
        spdlog::info("Waiting for changes... (Ctrl+C to stop)");
    }
}

}  // namespace videoml
