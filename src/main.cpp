#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include "TaskFactory.hpp"
#include "TaskRunner.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;

        if (!context.init(argc, argv)) {
            return 0;
        }

        const ConfigData& config = context.get_config_data();
        const GlobalConfig& global = config.global;

        // 2. Logger built from settings, handed to every component
        LogUtils::Logger logger = LogUtils::Logger::create(LogUtils::parse_level(global.log_level), global.log_file);
        LogUtils::LoggerGuard guard(logger);

        auto on_signal = [&logger](int signum) {
            logger.warn("Interrupt signal ({}) received. Shutting down...", signum);
            logger.shutdown();
            std::_Exit(128 + signum);
        };
        // Destroyed before the logger guard: no handler may outlive the logger
        SignalManager::CallbackGuard signal_guard;
        SignalManager::register_signal(SIGINT, on_signal);
        SignalManager::register_signal(SIGTERM, on_signal);
        SignalManager::setup();

        // 3. Discover handlers, then run
        try {
            size_t external = TaskFactory::instance().scan_directory(global.tasks_dir, logger);
            logger.debug("Loaded {} external handler(s) from {}", external, global.tasks_dir);

            TaskRunner runner(config, logger);
            RunResult run_result = runner.run();
            result = run_result.exit_code();

        } catch (const std::exception& e) {
            logger.error("Error during task execution: {}", e.what());
            result = 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help or -? to show usage information" << std::endl;
        result = 1;
    }

    return result;
}
