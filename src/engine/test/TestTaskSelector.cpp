#include <iostream>
#include <cassert>
#include "TaskSelector.hpp"

namespace {

Task make_task(const std::string& id, bool enabled = true) {
    Task task;
    task.id = id;
    task.enabled = enabled;
    return task;
}

std::vector<std::string> ids(const TaskSelection& selection) {
    std::vector<std::string> result;
    for (const auto* task : selection.tasks) result.push_back(task->id);
    return result;
}

}

void test_all_enabled_in_order() {
    std::vector<Task> tasks = {make_task("a"), make_task("b", false), make_task("c")};

    auto selection = TaskSelector::select(tasks);
    assert((ids(selection) == std::vector<std::string>{"a", "c"}));
    assert(selection.unknown.empty());
    assert(selection.disabled.empty());
    assert(selection.tasks[0] == &tasks[0]);
    std::cout << "test_all_enabled_in_order passed\n";
}

void test_cli_order_ignored() {
    std::vector<Task> tasks = {make_task("a"), make_task("b"), make_task("c")};

    auto selection = TaskSelector::select(tasks, std::string("c,a"));
    assert((ids(selection) == std::vector<std::string>{"a", "c"}));
    std::cout << "test_cli_order_ignored passed\n";
}

void test_whitespace_and_duplicates() {
    std::vector<Task> tasks = {make_task("a"), make_task("b"), make_task("c")};

    auto selection = TaskSelector::select(tasks, std::string(" b , ,b,c "));
    assert((ids(selection) == std::vector<std::string>{"b", "c"}));
    std::cout << "test_whitespace_and_duplicates passed\n";
}

void test_unknown_and_disabled_reported() {
    std::vector<Task> tasks = {make_task("a"), make_task("b", false)};

    auto selection = TaskSelector::select(tasks, std::string("b,zzz,zzz"));
    assert(selection.empty());
    assert((selection.unknown == std::vector<std::string>{"zzz"}));
    assert((selection.disabled == std::vector<std::string>{"b"}));
    std::cout << "test_unknown_and_disabled_reported passed\n";
}

void test_empty_id_list_selects_all() {
    std::vector<Task> tasks = {make_task("a"), make_task("b")};

    auto selection = TaskSelector::select(tasks, std::string(" , "));
    assert((ids(selection) == std::vector<std::string>{"a", "b"}));
    std::cout << "test_empty_id_list_selects_all passed\n";
}

void test_no_tasks() {
    std::vector<Task> tasks;
    assert(TaskSelector::select(tasks).empty());

    std::vector<Task> all_disabled = {make_task("a", false)};
    assert(TaskSelector::select(all_disabled).empty());
    std::cout << "test_no_tasks passed\n";
}

int main() {
    test_all_enabled_in_order();
    test_cli_order_ignored();
    test_whitespace_and_duplicates();
    test_unknown_and_disabled_reported();
    test_empty_id_list_selects_all();
    test_no_tasks();

    std::cout << "All TaskSelector tests passed!\n";
    return 0;
}
