// About: Source discovery: turns a user-supplied path (file, directory or
// nothing) into the sorted, deduplicated list of composition sources.
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "videoml/core/types.h"

namespace videoml {

namespace fs = std::filesystem;

/// Which file names count as composition sources: `*.<dsl>.ts` and
/// `*.<dsl>.xml`.
struct SourceMatcher {
    std::string dsl{"babulus"};

    [[nodiscard]] bool matches(const fs::path& path) const;
    [[nodiscard]] std::string describe() const;   // ".babulus.ts or .babulus.xml"
};

/// Collect matching files under `root`. Explicit worklist traversal;
/// result sorted lexicographically without duplicates.
[[nodiscard]] std::vector<SourcePath> find_source_files(const fs::path& root,
                                                        const SourceMatcher& matcher,
                                                        bool recursive = true);

/// Resolve the CLI source argument against `cwd`.
///
/// - explicit file: returned as-is (NotFoundError when missing)
/// - explicit directory: every matching file below it
/// - nothing: everything under `cwd/content/` when that directory exists,
///   otherwise exactly one match directly in `cwd`
///
/// Throws AmbiguousDiscoveryError when discovery finds no candidate, or
/// more than one outside `content/`.
[[nodiscard]] std::vector<SourcePath> resolve_sources(const std::optional<std::string>& arg,
                                                      const fs::path& cwd,
                                                      const SourceMatcher& matcher = {});

}  // namespace videoml
