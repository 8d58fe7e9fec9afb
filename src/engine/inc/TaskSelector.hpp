#pragma once

#include "Task.hpp"
#include <optional>
#include <string>
#include <vector>

struct TaskSelection {
    std::vector<const Task*> tasks;      // Configuration order
    std::vector<std::string> unknown;    // Requested ids with no configured task
    std::vector<std::string> disabled;   // Requested ids whose task is disabled

    bool empty() const { return tasks.empty(); }
};

class TaskSelector {
public:
    // Drops disabled tasks, then keeps only the ids named in cli_task_ids
    // (comma-separated) when it is given. The order of cli_task_ids is ignored.
    static TaskSelection select(const std::vector<Task>& all_tasks,
                                const std::optional<std::string>& cli_task_ids = std::nullopt);
};
