#include "TaskRunner.hpp"
#include "PlaceholderResolver.hpp"
#include "StringUtils.hpp"
#include "TaskSelector.hpp"

namespace {

std::unique_ptr<TaskExecutionStrategy> make_strategy(const ConfigData& config, const LogUtils::Logger& logger) {
    if (config.global.dry_run) {
        return std::make_unique<DryRunTaskStrategy>(config, logger);
    }
    return std::make_unique<ProductionTaskStrategy>(config, logger);
}

std::vector<std::string> ids_of(const std::vector<const Task*>& tasks) {
    std::vector<std::string> ids;
    for (const auto* task : tasks) ids.push_back(task->id);
    return ids;
}

}

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Idle:       return "Idle";
        case RunState::Selecting:  return "Selecting";
        case RunState::Confirming: return "Confirming";
        case RunState::Resolving:  return "Resolving";
        case RunState::Executing:  return "Executing";
        case RunState::Finished:   return "Finished";
        case RunState::Halted:     return "Halted";
        case RunState::Cancelled:  return "Cancelled";
        default:                   return "Unknown";
    }
}

TaskRunner::TaskRunner(const ConfigData& config, const LogUtils::Logger& logger)
    : TaskRunner(config, logger, make_strategy(config, logger),
                 config.global.confirm_prompt ? std::make_unique<TerminalPrompt>() : nullptr) {
}

TaskRunner::TaskRunner(const ConfigData& config,
                       const LogUtils::Logger& logger,
                       std::unique_ptr<TaskExecutionStrategy> strategy,
                       std::unique_ptr<ConfirmationPrompt> prompt)
    : config_(config),
      logger_(logger),
      strategy_(std::move(strategy)),
      gate_(!config.global.confirm_prompt, std::move(prompt)) {
}

void TaskRunner::transition(RunState next) {
    logger_.debug("Runner state: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

Task TaskRunner::resolve(const Task& task) const {
    Task resolved = task;
    resolved.params = PlaceholderResolver::resolve(task.params, config_.document);
    return resolved;
}

RunResult TaskRunner::run() {
    RunResult result;
    logger_.info("Starting Task Runner for project: \"{}\"", config_.project.name);

    transition(RunState::Selecting);
    TaskSelection selection = TaskSelector::select(config_.tasks, config_.global.selected_tasks);

    if (config_.global.selected_tasks) {
        logger_.info("Running selected tasks: {}", StringUtils::join(ids_of(selection.tasks), ", "));
    } else {
        logger_.info("Running all tasks in order: {}", StringUtils::join(ids_of(selection.tasks), ", "));
    }
    for (const auto& id : selection.unknown) {
        logger_.warn("Ignoring unknown task id: '{}'", id);
    }
    for (const auto& id : selection.disabled) {
        logger_.warn("Ignoring disabled task: '{}'", id);
    }

    if (selection.empty()) {
        logger_.warn("No tasks to run. Exiting.");
        transition(RunState::Finished);
        result.state = state_;
        return result;
    }

    if (gate_.bypassed()) {
        logger_.info("'-y' flag detected. Running in non-interactive mode.");
    }

    for (const Task* task : selection.tasks) {
        transition(RunState::Confirming);
        Confirmation decision = gate_.confirm(*task);

        if (decision == Confirmation::Abort) {
            logger_.warn("Wizard cancelled by user. Exiting.");
            transition(RunState::Cancelled);
            result.state = state_;
            return result;
        }

        if (decision == Confirmation::Skip) {
            logger_.warn("Skipping task: '{}' as requested by user.", task->id);
            result.outcomes.push_back({task->id, TaskStatus::Skipped});
            continue;
        }

        transition(RunState::Resolving);
        Task resolved = resolve(*task);

        transition(RunState::Executing);
        if (!strategy_->execute(resolved)) {
            result.outcomes.push_back({task->id, TaskStatus::Failed});
            logger_.error("Stopping runner due to a failed task.");
            transition(RunState::Halted);
            result.state = state_;
            return result;
        }
        result.outcomes.push_back({task->id, TaskStatus::Succeeded});
    }

    transition(RunState::Finished);
    logger_.info("Task runner finished.");
    result.state = state_;
    return result;
}
