#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ConfigData.hpp"
#include "ConfirmationGate.hpp"
#include "LogUtils.hpp"
#include "TaskExecutionStrategy.hpp"


enum class RunState {
    Idle,
    Selecting,
    Confirming,
    Resolving,
    Executing,
    Finished,
    Halted,     // A task failed; nothing after it ran
    Cancelled   // The confirmation prompt was abandoned
};

enum class TaskStatus {
    Succeeded,
    Failed,
    Skipped
};

struct TaskOutcome {
    std::string id;
    TaskStatus status;
};

struct RunResult {
    RunState state = RunState::Idle;
    std::vector<TaskOutcome> outcomes;   // In execution order

    // 0 for Finished and Cancelled, 1 for Halted
    int exit_code() const { return state == RunState::Halted ? 1 : 0; }
};

const char* to_string(RunState state);

// Sequential, fail-fast task runner
class TaskRunner {
public:
    // Production wiring: terminal prompt and the strategy selected by --dry-run
    TaskRunner(const ConfigData& config, const LogUtils::Logger& logger);

    TaskRunner(const ConfigData& config,
               const LogUtils::Logger& logger,
               std::unique_ptr<TaskExecutionStrategy> strategy,
               std::unique_ptr<ConfirmationPrompt> prompt);

    // Run selected tasks in order, stopping at the first failure
    RunResult run();

    RunState state() const { return state_; }

private:
    void transition(RunState next);
    Task resolve(const Task& task) const;

    const ConfigData& config_;                              // Configuration data
    const LogUtils::Logger& logger_;
    std::unique_ptr<TaskExecutionStrategy> strategy_;       // Task execution strategy
    ConfirmationGate gate_;
    RunState state_ = RunState::Idle;
};
