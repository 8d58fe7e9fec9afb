#include "ShellTask.hpp"
#include <filesystem>
#include <stdexcept>

std::vector<std::string> ShellTask::commands_from(const nlohmann::ordered_json& params) {
    if (!params.is_object()) {
        throw std::invalid_argument("shell task requires params.command or params.commands");
    }

    std::vector<std::string> commands;
    if (params.contains("command")) {
        if (!params["command"].is_string()) {
            throw std::invalid_argument("params.command must be a string");
        }
        commands.push_back(params["command"].get<std::string>());
    }

    if (params.contains("commands")) {
        if (!params["commands"].is_array()) {
            throw std::invalid_argument("params.commands must be a list of strings");
        }
        for (const auto& command : params["commands"]) {
            if (!command.is_string()) {
                throw std::invalid_argument("params.commands must be a list of strings");
            }
            commands.push_back(command.get<std::string>());
        }
    }

    if (commands.empty()) {
        throw std::invalid_argument("shell task requires params.command or params.commands");
    }
    return commands;
}

std::string ShellTask::working_dir_for(const nlohmann::ordered_json& params, const ConfigData& config) {
    std::filesystem::path base = config.project.absolute_base_path().value_or("");

    if (params.is_object() && params.contains("cwd") && params["cwd"].is_string()) {
        std::filesystem::path cwd = params["cwd"].get<std::string>();
        if (cwd.is_relative() && !base.empty()) {
            cwd = base / cwd;
        }
        return cwd.string();
    }
    return base.string();
}

void ShellTask::run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) {
    const auto commands = commands_from(params);
    const std::string working_dir = working_dir_for(params, config);

    for (const auto& command : commands) {
        logger.info("Executing: {}", command);
        auto result = runner_(command, working_dir);

        for (const auto& line : ProcessUtils::split_lines(result.stdout_text)) {
            logger.info(line);
        }
        for (const auto& line : ProcessUtils::split_lines(result.stderr_text)) {
            logger.warn(line);
        }

        if (!result.ok()) {
            throw std::runtime_error(fmt::format("Command '{}' exited with code {}", command, result.exit_code));
        }
    }
}
