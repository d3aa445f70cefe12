#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include <efsw/efsw.hpp>

namespace videoml {

namespace fs = std::filesystem;

/// Receives absolute paths of changed files (efsw's thread).
using FileChangeCallback = std::function<void(const fs::path& path)>;

/// Recursive efsw watches over a fixed set of directories. Build output,
/// VCS and dependency directories are filtered out before the callback.
class DirectoryWatcher {
public:
    explicit DirectoryWatcher(FileChangeCallback callback, bool use_polling = false);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /// Watch every directory recursively. Throws FilesystemWatchError when a
    /// watch cannot be established; nothing stays registered in that case.
    void watch(const std::vector<fs::path>& directories);

    void stop();

    [[nodiscard]] bool is_watching() const { return watcher_ != nullptr; }

    /// node_modules, .git, dist, .videoml/out and .babulus/out.
    [[nodiscard]] static bool is_ignored(const fs::path& path);

private:
    class Listener;

    FileChangeCallback                  callback_;
    bool                                use_polling_;
    std::unique_ptr<efsw::FileWatcher>  watcher_;
    std::unique_ptr<Listener>           listener_;
    std::vector<efsw::WatchID>          watch_ids_;
};

}  // namespace videoml
