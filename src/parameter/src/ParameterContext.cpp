#include "ParameterContext.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <sstream>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path (.json, .yaml or .yml)", true},
    {"--tasks", 't', "Run specific tasks by ID (comma-separated)", true},
    {"--yes", 'y', "Skip the confirmation wizard and run all selected tasks", false},
    {"--dry-run", 'n', "Show what would run without executing any handler", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: taskrun [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');

        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  TASKRUN_CONFIG_FILE   Config file used when --config-file is not given\n"
              << "  TASKRUN_LOG_LEVEL     Overrides settings.logLevel\n"
              << "  TASKRUN_TASKS_DIR     Overrides settings.tasksDir\n"
              << "\nExamples:\n"
              << "  taskrun --config-file=config.json\n"
              << "  taskrun -t build,deploy -y\n\n";
}

void ParameterContext::show_version() {
    std::cout << "taskrun version: " << TASKRUN_VERSION << std::endl;
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& global = config_data.global;

    if (cli_params.count("--config-file")) {
        global.config_file = cli_params["--config-file"];
    }

    // An empty --tasks value selects everything, like no option at all
    if (cli_params.count("--tasks") && !cli_params["--tasks"].empty()) {
        global.selected_tasks = cli_params["--tasks"];
    }

    if (cli_params.count("--yes")) {
        global.confirm_prompt = false;
    }

    if (cli_params.count("--dry-run")) {
        global.dry_run = true;
    }

    if (cli_params.count("--verbose")) {
        global.verbose = true;
        global.log_level = "debug";
    }
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"TASKRUN_LOG_LEVEL", "log_level"},
        {"TASKRUN_TASKS_DIR", "tasks_dir"}
    };

    auto& global = config_data.global;
    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && env_value[0] != '\0') {
            if (key == "log_level") {
                global.log_level = env_value;
            } else if (key == "tasks_dir") {
                global.tasks_dir = env_value;
            }
        }
    }
}

void ParameterContext::merge_document(const nlohmann::ordered_json& document, const std::string& config_dir) {
    ConfigParser::parse_document(document, config_data, config_dir);
}

void ParameterContext::merge_config_file(const std::string& file_path) {
    config_data.global.config_file = file_path;

    auto document = ConfigParser::load_document(file_path);
    std::string config_dir = std::filesystem::path(file_path).parent_path().string();
    merge_document(document, config_dir);
}

std::string ParameterContext::config_file_path() const {
    auto it = cli_params.find("--config-file");
    if (it != cli_params.end() && !it->second.empty()) {
        return it->second;
    }

    const char* env_value = std::getenv("TASKRUN_CONFIG_FILE");
    if (env_value && env_value[0] != '\0') {
        return env_value;
    }
    return config_data.global.config_file;
}

void ParameterContext::finalize_tasks_dir() {
    auto& global = config_data.global;
    if (!global.tasks_dir.empty()) return;

    std::filesystem::path config_dir = std::filesystem::path(global.config_file).parent_path();
    global.tasks_dir = (config_dir / "tasks").string();
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_config_file(config_file_path());
    merge_environment_vars();
    merge_commandline();
    finalize_tasks_dir();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}
