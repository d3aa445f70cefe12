#include "videoml/core/process.h"

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <sys/wait.h>

#include <spdlog/spdlog.h>

namespace videoml {

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string join_command(const std::vector<std::string>& argv, const EnvOverrides& env) {
    std::string cmd;
    for (const auto& [key, value] : env) {
        cmd += key + "=" + shell_quote(value) + " ";
    }
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd += ' ';
        cmd += shell_quote(argv[i]);
    }
    return cmd;
}

CommandResult run_command(const std::vector<std::string>& argv,
                          const LineCallback& on_line,
                          const EnvOverrides& env) {
    if (argv.empty()) {
        throw std::runtime_error("Cannot run an empty command");
    }

    auto command = join_command(argv, env);
    spdlog::debug("exec: {}", command);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to run command: " + command);
    }

    CommandResult result;
    std::array<char, 4096> buffer{};
    std::string line;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result.output += buffer.data();
        line += buffer.data();
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (on_line) on_line(line);
            line.clear();
        }
    }
    if (!line.empty() && on_line) on_line(line);

    int status = pclose(pipe.release());
    if (status == -1) {
        throw std::runtime_error("Failed to wait for command: " + command);
    }
    result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

}  // namespace videoml
