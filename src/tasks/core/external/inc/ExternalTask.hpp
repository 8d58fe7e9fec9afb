#pragma once
#include "TaskBase.hpp"
#include <string>

// Handler implemented by an executable found under the tasks directory.
// The resolved params and the whole configuration are passed as JSON in
// TASKRUN_PARAMS and TASKRUN_CONFIG; the process runs in the project base path.
class ExternalTask : public TaskBase {
public:
    explicit ExternalTask(std::string executable) : executable_(std::move(executable)) {}

    void run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};
