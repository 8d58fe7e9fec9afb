#pragma once

#include "ConfigData.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include "Task.hpp"
#include <string>
#include <vector>

// Post-task git steps. Commands are built as shell strings; only double quotes in
// the commit message are escaped, so file names and messages must be trusted.
class GitActions {
public:
    explicit GitActions(ProcessUtils::CommandRunner runner = ProcessUtils::run_shell)
        : runner_(std::move(runner)) {}

    // Runs add, commit and push in that order for the steps the task configures.
    // Throws std::invalid_argument for configuration errors before any command runs,
    // and std::runtime_error once a command has failed.
    void run(const Task& task, const ConfigData& config, const LogUtils::Logger& logger) const;

    // Message for the commit step; `true` takes the task description
    static std::string commit_message(const Task& task);

    static std::string add_command(const std::vector<std::string>& files);
    static std::string commit_command(const std::string& message);
    static std::string push_command();

private:
    ProcessUtils::CommandResult execute(const std::string& command, const std::string& working_dir,
                                        const LogUtils::Logger& logger) const;

    ProcessUtils::CommandRunner runner_;
};
