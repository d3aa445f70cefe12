#include "videoml/pipeline/source_resolver.h"

#include <set>

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool SourceMatcher::matches(const fs::path& path) const {
    auto name = path.filename().string();
    return ends_with(name, "." + dsl + ".ts") || ends_with(name, "." + dsl + ".xml");
}

std::string SourceMatcher::describe() const {
    return "." + dsl + ".ts or ." + dsl + ".xml";
}

std::vector<SourcePath> find_source_files(const fs::path& root,
                                          const SourceMatcher& matcher,
                                          bool recursive) {
    std::set<SourcePath> found;
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        auto dir = std::move(pending.back());
        pending.pop_back();

        for (const auto& entry : fs::directory_iterator(dir)) {
            // Links are never followed; a loop would never terminate
            if (entry.is_symlink()) continue;
            if (entry.is_directory()) {
                if (recursive) pending.push_back(entry.path());
                continue;
            }
            if (entry.is_regular_file() && matcher.matches(entry.path())) {
                found.insert(fs::absolute(entry.path()).lexically_normal());
            }
        }
    }

    return {found.begin(), found.end()};
}

std::vector<SourcePath> resolve_sources(const std::optional<std::string>& arg,
                                        const fs::path& cwd,
                                        const SourceMatcher& matcher) {
    if (arg) {
        auto candidate = absolute_from(cwd, *arg);
        if (!fs::exists(candidate)) {
            throw NotFoundError("Path does not exist: " + candidate.string());
        }
        if (fs::is_regular_file(candidate)) {
            return {candidate};
        }
        auto files = find_source_files(candidate, matcher);
        spdlog::debug("Found {} source(s) under {}", files.size(), candidate.string());
        return files;
    }

    auto content_dir = absolute_from(cwd, "content");
    bool in_content = fs::is_directory(content_dir);
    auto found = in_content
        ? find_source_files(content_dir, matcher)
        : find_source_files(absolute_from(cwd, "."), matcher, false);

    if (found.empty()) {
        throw AmbiguousDiscoveryError(
            "No " + matcher.describe() + " files found. "
            "Pass a file or directory path, or create one under ./content/");
    }
    if (found.size() > 1 && !in_content) {
        throw AmbiguousDiscoveryError(
            "Multiple " + matcher.describe() + " files found (" +
            std::to_string(found.size()) + "). Pass a specific file or directory path.");
    }
    return found;
}

}  // namespace videoml
