#pragma once

#include <filesystem>
#include <optional>
#include <string>

struct ProjectInfo {
    std::string name;
    std::optional<std::string> base_path;

    // basePath made absolute against the process working directory
    std::optional<std::string> absolute_base_path() const {
        if (!base_path) return std::nullopt;
        return std::filesystem::absolute(*base_path).lexically_normal().string();
    }
};

struct GlobalConfig {
    std::string config_file = "config.json";
    std::string log_file = "runner.log";
    std::string log_level = "info";
    std::string tasks_dir;                     // Empty means "tasks" beside the config file

    bool confirm_prompt = true;                // Cleared by --yes
    bool verbose = false;
    bool dry_run = false;
    std::optional<std::string> selected_tasks; // Raw comma-separated --tasks value
};
