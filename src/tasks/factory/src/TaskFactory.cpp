#include "TaskFactory.hpp"
#include "ExternalTask.hpp"
#include "ConfigParser.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

TaskFactory& TaskFactory::instance() {
    static TaskFactory factory;
    return factory;
}

void TaskFactory::register_task(const std::string& name, TaskCreator creator) {
    creators_[name] = std::move(creator);
}

bool TaskFactory::has_task(const std::string& name) const {
    return creators_.find(name) != creators_.end();
}

std::unique_ptr<TaskBase> TaskFactory::create_task(const std::string& name) const {
    auto it = creators_.find(name);
    if (it == creators_.end()) {
        throw std::out_of_range("Unknown task handler: " + name);
    }
    return it->second();
}

std::vector<std::string> TaskFactory::registered_names() const {
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& kv : creators_) {
        names.push_back(kv.first);
    }
    return names;
}

std::string TaskFactory::entry_point_path(const std::string& tasks_dir, const std::string& name) {
    return (fs::path(tasks_dir) / name / "run").string();
}

bool TaskFactory::is_executable_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

size_t TaskFactory::scan_directory(const std::string& tasks_dir, const LogUtils::Logger& logger) {
    std::error_code ec;
    if (!fs::is_directory(tasks_dir, ec)) {
        logger.debug("Tasks directory not found, no external handlers loaded: {}", tasks_dir);
        return 0;
    }

    size_t added = 0;
    for (const auto& entry : fs::directory_iterator(tasks_dir, ec)) {
        if (!entry.is_directory(ec)) continue;

        const std::string name = entry.path().filename().string();
        if (!ConfigParser::is_safe_task_id(name)) continue;

        const std::string run_path = entry_point_path(tasks_dir, name);
        if (!is_executable_file(run_path)) {
            logger.debug("Skipping '{}': no executable entry point at {}", name, run_path);
            continue;
        }

        if (has_task(name)) {
            logger.warn("Handler '{}' at {} is shadowed by a built-in handler", name, run_path);
            continue;
        }

        register_task(name, [run_path]() {
            return std::make_unique<ExternalTask>(run_path);
        });
        logger.debug("Registered external handler '{}' -> {}", name, run_path);
        ++added;
    }

    if (ec) {
        throw std::system_error(ec, "Cannot scan tasks directory " + tasks_dir);
    }
    return added;
}
