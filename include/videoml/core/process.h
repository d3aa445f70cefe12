// About: Subprocess helper used by the collaborator adapters. Commands run
// through the shell with every argument quoted; stdout is captured line by
// line, stderr passes through to the terminal.
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace videoml {

struct CommandResult {
    int         exit_status{-1};
    std::string output;         // captured stdout

    [[nodiscard]] bool ok() const { return exit_status == 0; }
};

using LineCallback = std::function<void(const std::string& line)>;
using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

/// Single-quote an argument for /bin/sh.
[[nodiscard]] std::string shell_quote(const std::string& arg);

/// Render argv (and child-only environment assignments) as a shell line.
[[nodiscard]] std::string join_command(const std::vector<std::string>& argv,
                                       const EnvOverrides& env = {});

/// Run argv to completion. `on_line` sees each stdout line (without the
/// trailing newline) as it arrives. Throws std::runtime_error when the
/// process cannot be started.
CommandResult run_command(const std::vector<std::string>& argv,
                          const LineCallback& on_line = {},
                          const EnvOverrides& env = {});

}  // namespace videoml
