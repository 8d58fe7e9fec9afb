#include "ExternalTask.hpp"
#include "ProcessUtils.hpp"
#include <stdexcept>

void ExternalTask::run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) {
    const std::string working_dir = config.project.absolute_base_path().value_or("");

    ProcessUtils::EnvList env = {
        {"TASKRUN_PARAMS", params.dump()},
        {"TASKRUN_CONFIG", config.document.dump()},
        {"TASKRUN_PROJECT_NAME", config.project.name}
    };

    logger.debug("Executing: {}", executable_);
    auto result = ProcessUtils::run_program(executable_, {}, working_dir, env);

    for (const auto& line : ProcessUtils::split_lines(result.stdout_text)) {
        logger.info(line);
    }
    for (const auto& line : ProcessUtils::split_lines(result.stderr_text)) {
        logger.warn(line);
    }

    if (!result.ok()) {
        throw std::runtime_error(fmt::format("Handler {} exited with code {}", executable_, result.exit_code));
    }
}
