#pragma once

#include "ConfigData.hpp"
#include "GitActions.hpp"
#include "LogUtils.hpp"
#include "Task.hpp"
#include "TaskFactory.hpp"


// Abstract base class: task execution strategy.
// execute() reports failures through its return value and never throws.
class TaskExecutionStrategy {
public:
    TaskExecutionStrategy(const ConfigData& config, const LogUtils::Logger& logger)
        : config_(config), logger_(logger) {}

    virtual ~TaskExecutionStrategy() = default;

    // `task` is already resolved
    virtual bool execute(const Task& task) = 0;

protected:
    const ConfigData& config_;
    const LogUtils::Logger& logger_;
};

// Production environment strategy
class ProductionTaskStrategy : public TaskExecutionStrategy {
public:
    ProductionTaskStrategy(const ConfigData& config,
                           const LogUtils::Logger& logger,
                           TaskFactory& factory = TaskFactory::instance(),
                           GitActions git = GitActions())
        : TaskExecutionStrategy(config, logger), factory_(factory), git_(std::move(git)) {}

    bool execute(const Task& task) override;

private:
    void report_missing_handler(const Task& task, const LogUtils::Logger& task_logger) const;

    TaskFactory& factory_;
    GitActions git_;
};

// Dry-run strategy: reports what would run
class DryRunTaskStrategy : public TaskExecutionStrategy {
public:
    DryRunTaskStrategy(const ConfigData& config,
                       const LogUtils::Logger& logger,
                       const TaskFactory& factory = TaskFactory::instance())
        : TaskExecutionStrategy(config, logger), factory_(factory) {}

    bool execute(const Task& task) override;

private:
    const TaskFactory& factory_;
};
