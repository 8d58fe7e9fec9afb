#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when help or version was printed and the run should stop
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_document(const nlohmann::ordered_json& document, const std::string& config_dir = "");
    void merge_config_file(const std::string& file_path);

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;

    // Config file named by --config-file, then TASKRUN_CONFIG_FILE, then the default
    std::string config_file_path() const;

private:
    ConfigData config_data; // Top-level config data

    std::unordered_map<std::string, std::string> cli_params;

    void finalize_tasks_dir();

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--tasks")
        char short_opt;          // Short option (e.g. 't')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
