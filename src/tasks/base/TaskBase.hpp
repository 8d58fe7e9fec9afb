#pragma once

#include "ConfigData.hpp"
#include "LogUtils.hpp"
#include <nlohmann/json.hpp>

// Entry point of a task handler. Returning normally is success; throwing is failure.
class TaskBase {
public:
    virtual ~TaskBase() = default;
    virtual void run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) = 0;
};
