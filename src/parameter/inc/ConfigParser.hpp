#pragma once

#include "ConfigData.hpp"
#include "GitConfig.hpp"
#include "Task.hpp"

#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>


namespace ConfigParser {

    void check_unknown_keys(const nlohmann::ordered_json& node, const std::set<std::string>& valid_keys, const std::string& context);

    // Non-empty, only [A-Za-z0-9._-], and neither "." nor ".."
    bool is_safe_task_id(const std::string& id);

    // Quoted scalars stay strings; plain scalars become bool, null, integer or float when they look like one
    nlohmann::ordered_json yaml_to_json(const YAML::Node& node);

    // Parse a .yaml/.yml file through yaml-cpp, anything else as JSON
    nlohmann::ordered_json load_document(const std::string& file_path);

    // Decode project, settings and tasks; the document itself is kept as the placeholder root
    void parse_document(const nlohmann::ordered_json& document, ConfigData& config, const std::string& config_dir = "");

    // A definition that fails to decode becomes a task carrying config_error, so it
    // fails only when it is reached. Duplicate ids still reject the whole list.
    std::vector<Task> parse_tasks(const nlohmann::ordered_json& tasks_node);

    // Placeholder for an undecodable definition. Keeps id, description and enabled
    // when they have the right type; the id falls back to "#<position>".
    Task invalid_task(const nlohmann::ordered_json& task_node, size_t index, const std::string& error);

}

void from_json(const nlohmann::ordered_json& node, GitConfig& git);
void from_json(const nlohmann::ordered_json& node, Task& task);
void from_json(const nlohmann::ordered_json& node, ProjectInfo& project);
