#include "GitActions.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace {

class GitCommandError : public std::runtime_error {
public:
    GitCommandError(const std::string& command, const ProcessUtils::CommandResult& result)
        : std::runtime_error(fmt::format("'{}' exited with code {}", command, result.exit_code)),
          stdout_text(result.stdout_text),
          stderr_text(result.stderr_text) {}

    std::string stdout_text;
    std::string stderr_text;
};

std::string or_na(const std::string& text) {
    return text.empty() ? "N/A" : text;
}

}

std::string GitActions::commit_message(const Task& task) {
    if (!task.git || !task.git->commit) {
        throw std::invalid_argument("Task '" + task.id + "' has no commit configured");
    }

    const auto& commit = *task.git->commit;
    if (const auto* flag = std::get_if<bool>(&commit)) {
        if (!*flag) {
            throw std::invalid_argument("Task '" + task.id + "' has commit disabled");
        }
        if (!task.description || task.description->empty()) {
            throw std::invalid_argument("Cannot use 'commit: true' when the task has no description.");
        }
        return *task.description;
    }
    return std::get<std::string>(commit);
}

std::string GitActions::add_command(const std::vector<std::string>& files) {
    return "git add " + StringUtils::join(files, " ");
}

std::string GitActions::commit_command(const std::string& message) {
    return "git commit -m \"" + StringUtils::replace_all(message, "\"", "\\\"") + "\"";
}

std::string GitActions::push_command() {
    return "git push";
}

ProcessUtils::CommandResult GitActions::execute(const std::string& command, const std::string& working_dir,
                                                const LogUtils::Logger& logger) const {
    logger.info("Executing: {}", command);
    auto result = runner_(command, working_dir);
    if (!result.ok()) {
        throw GitCommandError(command, result);
    }
    return result;
}

void GitActions::run(const Task& task, const ConfigData& config, const LogUtils::Logger& logger) const {
    if (!task.git) return;
    const GitConfig& git = *task.git;

    // Configuration problems surface before any command runs
    const auto working_dir = config.project.absolute_base_path();
    if (!working_dir) {
        throw std::invalid_argument("Git actions require project.basePath in the configuration");
    }
    const std::string message = git.has_commit() ? commit_message(task) : std::string();

    auto git_logger = logger.child("git", "git");
    git_logger.info("Starting post-task Git actions...");

    try {
        if (git.has_add()) {
            execute(add_command(git.add), *working_dir, git_logger);
        }
        if (git.has_commit()) {
            auto result = execute(commit_command(message), *working_dir, git_logger);
            if (!result.stdout_text.empty()) {
                git_logger.info("Commit successful:\n{}", result.stdout_text);
            }
        }
        if (git.push) {
            auto result = execute(push_command(), *working_dir, git_logger);
            if (!result.stdout_text.empty()) git_logger.info(result.stdout_text);
            if (!result.stderr_text.empty()) git_logger.info(result.stderr_text);
        }
    } catch (const GitCommandError& e) {
        logger.error("A Git command failed:");
        logger.error(e.what());
        logger.error("STDOUT: {}", or_na(e.stdout_text));
        logger.error("STDERR: {}", or_na(e.stderr_text));
        throw std::runtime_error("Git operation failed. See logs for details.");
    } catch (const std::exception& e) {
        logger.error("A Git command failed:");
        logger.error(e.what());
        logger.error("STDOUT: N/A");
        logger.error("STDERR: N/A");
        throw std::runtime_error("Git operation failed. See logs for details.");
    }

    git_logger.success("Git actions completed successfully.");
}
