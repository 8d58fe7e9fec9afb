#pragma once
#include "TaskBase.hpp"
#include "TaskFactory.hpp"

// Writes params.message to the task log
class LogTask : public TaskBase {
public:
    void run(const nlohmann::ordered_json& params, const ConfigData& config, const LogUtils::Logger& logger) override;

private:
    // Register LogTask to TaskFactory
    inline static bool registered_ = []() {
        TaskFactory::instance().register_task("log", []() {
            return std::make_unique<LogTask>();
        });
        return true;
    }();
};
