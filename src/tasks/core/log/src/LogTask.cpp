#include "LogTask.hpp"
#include <stdexcept>

void LogTask::run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) {
    (void)config;

    if (!params.is_object() || !params.contains("message")) {
        throw std::invalid_argument("log task requires params.message");
    }

    const auto& message = params["message"];
    logger.info(message.is_string() ? message.get<std::string>() : message.dump());
}
