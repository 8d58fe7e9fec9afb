#include "TaskSelector.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <unordered_set>

TaskSelection TaskSelector::select(const std::vector<Task>& all_tasks,
                                   const std::optional<std::string>& cli_task_ids) {
    TaskSelection selection;

    std::vector<std::string> requested;
    if (cli_task_ids) {
        requested = StringUtils::split_list(*cli_task_ids, ',');
    }
    const bool filter_by_id = !requested.empty();
    std::unordered_set<std::string> wanted(requested.begin(), requested.end());

    for (const auto& task : all_tasks) {
        if (filter_by_id && wanted.find(task.id) == wanted.end()) {
            continue;
        }
        if (!task.enabled) {
            if (filter_by_id) selection.disabled.push_back(task.id);
            continue;
        }
        selection.tasks.push_back(&task);
    }

    for (const auto& id : requested) {
        bool configured = std::any_of(all_tasks.begin(), all_tasks.end(),
            [&id](const Task& task) { return task.id == id; });
        bool reported = std::find(selection.unknown.begin(), selection.unknown.end(), id) != selection.unknown.end();
        if (!configured && !reported) {
            selection.unknown.push_back(id);
        }
    }

    return selection;
}
