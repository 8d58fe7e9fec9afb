#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ProcessUtils {

struct CommandResult {
    int exit_code = -1;         // WEXITSTATUS, or 128 + signal number
    std::string stdout_text;
    std::string stderr_text;

    bool ok() const { return exit_code == 0; }
};

// Runs one shell command line in a working directory
using CommandRunner = std::function<CommandResult(const std::string& command, const std::string& working_dir)>;

using EnvList = std::vector<std::pair<std::string, std::string>>;

// Run a command line through /bin/sh -c. An empty working_dir keeps the current one.
// Throws std::system_error when the process cannot be spawned.
CommandResult run_shell(const std::string& command, const std::string& working_dir = "");

// Run an executable directly, with extra_env appended to the inherited environment
CommandResult run_program(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& working_dir = "",
                          const EnvList& extra_env = {});

// Split captured output into lines, dropping the trailing empty line
std::vector<std::string> split_lines(const std::string& text);

}
