#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "GlobalConfig.hpp"
#include "Task.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    ProjectInfo project;
    std::vector<Task> tasks;          // Configuration order is execution order
    nlohmann::ordered_json document;  // Whole document, the placeholder lookup root
};
