#include "videoml/pipeline/file_watcher.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

namespace {

// efsw rejects a watch inside an existing recursive watch
std::vector<fs::path> outermost(std::vector<fs::path> dirs) {
    for (auto& d : dirs) d = d.lexically_normal();
    std::sort(dirs.begin(), dirs.end());
    dirs.erase(std::unique(dirs.begin(), dirs.end()), dirs.end());

    std::vector<fs::path> roots;
    for (const auto& dir : dirs) {
        bool nested = std::any_of(roots.begin(), roots.end(), [&](const fs::path& root) {
            auto rel = dir.lexically_relative(root);
            return !rel.empty() && *rel.begin() != "..";
        });
        if (!nested) roots.push_back(dir);
    }
    return roots;
}

}  // namespace

// Listener implementation that inherits from efsw::FileWatchListener
class DirectoryWatcher::Listener : public efsw::FileWatchListener {
public:
    explicit Listener(DirectoryWatcher& owner) : owner_(owner) {}

    void handleFileAction(efsw::WatchID, const std::string& dir,
                          const std::string& filename, efsw::Action action,
                          std::string oldFilename) override {
        auto path = (fs::path(dir) / filename).lexically_normal();
        if (DirectoryWatcher::is_ignored(path)) return;

        spdlog::trace("efsw action {} on {}", static_cast<int>(action), path.string());
        owner_.callback_(path);

        // A rename also invalidates whatever used to live at the old name
        if (action == efsw::Actions::Moved && !oldFilename.empty()) {
            auto old_path = (fs::path(dir) / oldFilename).lexically_normal();
            if (!DirectoryWatcher::is_ignored(old_path)) owner_.callback_(old_path);
        }
    }

private:
    DirectoryWatcher& owner_;
};

DirectoryWatcher::DirectoryWatcher(FileChangeCallback callback, bool use_polling)
    : callback_(std::move(callback)), use_polling_(use_polling) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

void DirectoryWatcher::watch(const std::vector<fs::path>& directories) {
    stop();

    watcher_  = std::make_unique<efsw::FileWatcher>(use_polling_);
    listener_ = std::make_unique<Listener>(*this);

    for (const auto& dir : outermost(directories)) {
        efsw::WatchID id = watcher_->addWatch(dir.string(), listener_.get(), true);
        if (id < 0) {
            auto reason = efsw::Errors::Log::getLastErrorLog();
            stop();
            throw FilesystemWatchError("Failed to watch " + dir.string() + ": " + reason);
        }
        watch_ids_.push_back(id);
        spdlog::debug("Watching {} (recursive)", dir.string());
    }

    // Start watching in background thread
    watcher_->watch();
}

void DirectoryWatcher::stop() {
    if (watcher_) {
        for (auto id : watch_ids_) watcher_->removeWatch(id);
        watcher_.reset();
        listener_.reset();
    }
    watch_ids_.clear();
}

bool DirectoryWatcher::is_ignored(const fs::path& path) {
    fs::path previous;
    for (const auto& part : path) {
        if (part == "node_modules" || part == ".git" || part == "dist") return true;
        if (part == "out" && (previous == ".videoml" || previous == ".babulus")) return true;
        previous = part;
    }
    return false;
}

}  // namespace videoml
