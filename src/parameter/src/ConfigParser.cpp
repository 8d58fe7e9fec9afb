#include "ConfigParser.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(s[0])) && s[0] != '-' && s[0] != '+' && s[0] != '.') return false;

    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

std::string require_string(const nlohmann::ordered_json& node, const std::string& key, const std::string& context) {
    const auto& value = node.at(key);
    if (!value.is_string()) {
        throw std::runtime_error("Field '" + key + "' in " + context + " must be a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::ordered_json& node, const std::string& key, const std::string& context) {
    if (!node.contains(key) || node.at(key).is_null()) return std::nullopt;
    return require_string(node, key, context);
}

bool optional_bool(const nlohmann::ordered_json& node, const std::string& key, bool fallback, const std::string& context) {
    if (!node.contains(key) || node.at(key).is_null()) return fallback;
    const auto& value = node.at(key);
    if (!value.is_boolean()) {
        throw std::runtime_error("Field '" + key + "' in " + context + " must be a boolean");
    }
    return value.get<bool>();
}

}

namespace ConfigParser {

void check_unknown_keys(const nlohmann::ordered_json& node, const std::set<std::string>& valid_keys, const std::string& context) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (valid_keys.find(it.key()) == valid_keys.end()) {
            throw std::runtime_error("Unknown configuration key in " + context + ": " + it.key());
        }
    }
}

bool is_safe_task_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

nlohmann::ordered_json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            if (node.Tag() == "!") return s;

            if (s == "true" || s == "True" || s == "TRUE") return true;
            if (s == "false" || s == "False" || s == "FALSE") return false;
            if (s == "~" || s == "null" || s == "Null" || s == "NULL" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // Too large for a number, keep the text
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::ordered_json obj = nlohmann::ordered_json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

nlohmann::ordered_json load_document(const std::string& file_path) {
    namespace fs = std::filesystem;

    if (!fs::exists(file_path)) {
        throw std::runtime_error("Config file not found: " + file_path);
    }

    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == ".yaml" || ext == ".yml") {
        try {
            return yaml_to_json(YAML::LoadFile(file_path));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to parse config file '" + file_path + "': " + e.what());
        }
    }

    std::ifstream input(file_path);
    if (!input.is_open()) {
        throw std::runtime_error("Cannot open config file: " + file_path);
    }
    try {
        return nlohmann::ordered_json::parse(input);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file '" + file_path + "': " + e.what());
    }
}

Task invalid_task(const nlohmann::ordered_json& task_node, size_t index, const std::string& error) {
    Task task;
    task.config_error = error;
    task.id = "#" + std::to_string(index + 1);

    if (!task_node.is_object()) return task;

    if (task_node.contains("id") && task_node["id"].is_string() && !task_node["id"].get<std::string>().empty()) {
        task.id = task_node["id"].get<std::string>();
    }
    if (task_node.contains("description") && task_node["description"].is_string()) {
        task.description = task_node["description"].get<std::string>();
    }
    if (task_node.contains("enabled") && task_node["enabled"].is_boolean()) {
        task.enabled = task_node["enabled"].get<bool>();
    }
    return task;
}

std::vector<Task> parse_tasks(const nlohmann::ordered_json& tasks_node) {
    if (!tasks_node.is_array()) {
        throw std::runtime_error("Field 'tasks' must be a list of task definitions");
    }

    std::vector<Task> tasks;
    std::unordered_set<std::string> seen;
    for (size_t index = 0; index < tasks_node.size(); ++index) {
        const auto& task_node = tasks_node[index];

        Task task;
        try {
            task = task_node.get<Task>();
        } catch (const std::exception& e) {
            task = invalid_task(task_node, index, e.what());
        }

        if (!seen.insert(task.id).second) {
            throw std::runtime_error("Duplicate task id: " + task.id);
        }
        tasks.push_back(std::move(task));
    }
    return tasks;
}

void parse_document(const nlohmann::ordered_json& document, ConfigData& config, const std::string& config_dir) {
    if (!document.is_object()) {
        throw std::runtime_error("Configuration document must be an object");
    }

    if (document.contains("project") && !document["project"].is_null()) {
        config.project = document["project"].get<ProjectInfo>();
    }

    if (document.contains("settings") && !document["settings"].is_null()) {
        const auto& settings = document["settings"];
        if (!settings.is_object()) {
            throw std::runtime_error("Field 'settings' must be an object");
        }

        static const std::set<std::string> valid_keys = {
            "logFile", "logLevel", "tasksDir"
        };
        check_unknown_keys(settings, valid_keys, "settings");

        if (auto log_file = optional_string(settings, "logFile", "settings")) {
            config.global.log_file = *log_file;
        }
        if (auto log_level = optional_string(settings, "logLevel", "settings")) {
            config.global.log_level = *log_level;
        }
        if (auto tasks_dir = optional_string(settings, "tasksDir", "settings")) {
            std::filesystem::path dir(*tasks_dir);
            if (dir.is_relative() && !config_dir.empty()) {
                dir = std::filesystem::path(config_dir) / dir;
            }
            config.global.tasks_dir = dir.string();
        }
    }

    if (!document.contains("tasks")) {
        throw std::runtime_error("Missing required field 'tasks' in configuration");
    }
    config.tasks = parse_tasks(document["tasks"]);
    config.document = document;
}

}

void from_json(const nlohmann::ordered_json& node, GitConfig& git) {
    if (!node.is_object()) {
        throw std::runtime_error("Field 'git' must be an object");
    }

    static const std::set<std::string> valid_keys = {
        "add", "commit", "push"
    };
    ConfigParser::check_unknown_keys(node, valid_keys, "git");

    if (node.contains("add") && !node["add"].is_null()) {
        const auto& add = node["add"];
        if (add.is_string()) {
            if (!add.get<std::string>().empty()) {
                git.add.push_back(add.get<std::string>());
            }
        } else if (add.is_array()) {
            for (const auto& file : add) {
                if (!file.is_string()) {
                    throw std::runtime_error("Entries of git.add must be strings");
                }
                git.add.push_back(file.get<std::string>());
            }
        } else {
            throw std::runtime_error("Field 'add' in git must be a string or a list of strings");
        }
    }

    if (node.contains("commit") && !node["commit"].is_null()) {
        const auto& commit = node["commit"];
        if (commit.is_string()) {
            git.commit = commit.get<std::string>();
        } else if (commit.is_boolean()) {
            git.commit = commit.get<bool>();
        } else {
            throw std::runtime_error("Field 'commit' in git must be a string or a boolean");
        }
    }

    git.push = optional_bool(node, "push", false, "git");
}

void from_json(const nlohmann::ordered_json& node, Task& task) {
    if (!node.is_object()) {
        throw std::runtime_error("Each task definition must be an object");
    }

    static const std::set<std::string> valid_keys = {
        "id", "description", "enabled", "params", "git", "handler"
    };
    ConfigParser::check_unknown_keys(node, valid_keys, "task");

    if (!node.contains("id")) {
        throw std::runtime_error("Missing required field 'id' for task");
    }
    task.id = require_string(node, "id", "task");
    if (!ConfigParser::is_safe_task_id(task.id)) {
        throw std::runtime_error("Invalid task id '" + task.id + "': only letters, digits, '.', '_' and '-' are allowed");
    }

    const std::string context = "task '" + task.id + "'";
    task.description = optional_string(node, "description", context);
    task.enabled = optional_bool(node, "enabled", true, context);

    if (node.contains("params")) {
        task.params = node["params"];
    }

    if (node.contains("git") && !node["git"].is_null()) {
        task.git = node["git"].get<GitConfig>();
    }

    task.handler = optional_string(node, "handler", context);
    if (task.handler && !ConfigParser::is_safe_task_id(*task.handler)) {
        throw std::runtime_error("Invalid handler name '" + *task.handler + "' in " + context);
    }
}

void from_json(const nlohmann::ordered_json& node, ProjectInfo& project) {
    if (!node.is_object()) {
        throw std::runtime_error("Field 'project' must be an object");
    }

    if (node.contains("name") && node["name"].is_string()) {
        project.name = node["name"].get<std::string>();
    }
    if (node.contains("basePath") && !node["basePath"].is_null()) {
        if (!node["basePath"].is_string()) {
            throw std::runtime_error("Field 'basePath' in project must be a string");
        }
        project.base_path = node["basePath"].get<std::string>();
    }
}
