#pragma once

#include "TaskBase.hpp"
#include "LogUtils.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class TaskFactory {
public:
    using TaskCreator = std::function<std::unique_ptr<TaskBase>()>;

    TaskFactory() = default;

    // Process-wide factory that compiled-in handlers register with
    static TaskFactory& instance();

    // Later registrations under the same name replace earlier ones
    void register_task(const std::string& name, TaskCreator creator);
    bool has_task(const std::string& name) const;

    // Throws std::out_of_range for an unknown name; may return nullptr if the creator does
    std::unique_ptr<TaskBase> create_task(const std::string& name) const;

    std::vector<std::string> registered_names() const;

    // Register every <tasks_dir>/<name>/run executable as an external handler.
    // Names already registered keep their existing handler. Returns the number added.
    size_t scan_directory(const std::string& tasks_dir, const LogUtils::Logger& logger);

    static std::string entry_point_path(const std::string& tasks_dir, const std::string& name);
    static bool is_executable_file(const std::string& path);

private:
    std::map<std::string, TaskCreator> creators_;
};
