#include "TaskExecutionStrategy.hpp"
#include "LogTask.hpp"
#include "ShellTask.hpp"
#include <exception>
#include <filesystem>

namespace {

// what() of the exception and of every exception nested inside it
void log_exception_chain(const std::exception& e, const LogUtils::Logger& logger, int depth = 0) {
    logger.error("{}{}", std::string(depth * 2, ' '), e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        log_exception_chain(nested, logger, depth + 1);
    }
}

// Logs the decode error of a definition that could not be read; true when there is one
bool report_config_error(const Task& task, const LogUtils::Logger& task_logger) {
    if (!task.config_error) return false;
    task_logger.error("Invalid task definition: {}", *task.config_error);
    return true;
}

}

void ProductionTaskStrategy::report_missing_handler(const Task& task, const LogUtils::Logger& task_logger) const {
    const std::string& name = task.handler_name();
    const std::string entry = TaskFactory::entry_point_path(config_.global.tasks_dir, name);
    const auto dir = std::filesystem::path(entry).parent_path();

    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        task_logger.error("Task directory found at {} but it must provide an executable named 'run'", dir.string());
    } else {
        task_logger.error("Task directory or entry point not found at: {}", entry);
    }
}

// Implementation of production environment strategy
bool ProductionTaskStrategy::execute(const Task& task) {
    auto task_logger = logger_.child("task", task.id);

    if (report_config_error(task, task_logger)) {
        return false;
    }

    if (!factory_.has_task(task.handler_name())) {
        report_missing_handler(task, task_logger);
        return false;
    }

    try {
        auto handler = factory_.create_task(task.handler_name());
        if (!handler) {
            throw std::runtime_error("Task handler '" + task.handler_name() + "' does not provide a run entry point.");
        }

        task_logger.info("Starting task execution... ({})", task.display_name());
        handler->run(task.params, config_, task_logger);
        git_.run(task, config_, task_logger);

        task_logger.success("Task completed successfully.");
        return true;

    } catch (const std::exception& e) {
        task_logger.error("Task failed with an error:");
        log_exception_chain(e, task_logger);
        return false;
    }
}


// Implementation of dry-run strategy
bool DryRunTaskStrategy::execute(const Task& task) {
    auto task_logger = logger_.child("task", task.id);

    if (report_config_error(task, task_logger)) {
        return false;
    }

    const std::string& name = task.handler_name();
    if (!factory_.has_task(name)) {
        task_logger.error("Unknown task handler: {} (expected {})",
                          name, TaskFactory::entry_point_path(config_.global.tasks_dir, name));
        return false;
    }
    task_logger.info("Would run handler '{}' with params: {}", name, task.params.dump());

    if (task.git) {
        std::vector<std::string> steps;
        if (task.git->has_add()) steps.push_back(GitActions::add_command(task.git->add));
        if (task.git->has_commit()) steps.push_back("git commit");
        if (task.git->push) steps.push_back(GitActions::push_command());
        for (const auto& step : steps) {
            task_logger.info("Would run: {}", step);
        }
    }
    return true;
}
