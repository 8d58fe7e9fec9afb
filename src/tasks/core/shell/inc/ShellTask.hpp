#pragma once
#include "TaskBase.hpp"
#include "TaskFactory.hpp"
#include "ProcessUtils.hpp"
#include <string>
#include <vector>

// Runs params.command, or each of params.commands in order, through the shell.
// Commands run in params.cwd (relative to the project base path), otherwise in the
// project base path. The first failing command fails the task.
class ShellTask : public TaskBase {
public:
    explicit ShellTask(ProcessUtils::CommandRunner runner = ProcessUtils::run_shell)
        : runner_(std::move(runner)) {}

    void run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) override;

    static std::vector<std::string> commands_from(const nlohmann::ordered_json& params);
    static std::string working_dir_for(const nlohmann::ordered_json& params, const ConfigData& config);

private:
    ProcessUtils::CommandRunner runner_;

    // Register ShellTask to TaskFactory
    inline static bool registered_ = []() {
        TaskFactory::instance().register_task("shell", []() {
            return std::make_unique<ShellTask>();
        });
        return true;
    }();
};
