#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>
#include <utility>
#include <vector>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Success,
    Warn,
    Error
};

// Maps a settings.logLevel string to a level, falling back to Info
Level parse_level(const std::string& name);

// Name of the backend logger that carries success events
extern const char* const SUCCESS_LOGGER_NAME;

class Logger {
public:
    using Context = std::vector<std::pair<std::string, std::string>>;

    // Logger without sinks, writes to stdout/stderr
    Logger() = default;

    // Initialize the log system: console sink plus rotating file sink
    static Logger create(Level level = Level::Info,
                         const std::string& log_file = "runner.log",
                         size_t max_file_size = 1024 * 1024 * 5,
                         size_t max_files = 3);

    void shutdown();
    void set_level(Level level);

    // Derived logger whose lines carry an extra [value] tag
    Logger child(const std::string& key, const std::string& value) const;

    const Context& context() const { return context_; }

    void debug(const std::string& msg) const;
    void info(const std::string& msg) const;
    void success(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void error(const std::string& msg) const;

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        debug(fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        info(fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline void success(fmt::format_string<Args...> fmt, Args&&... args) const {
        success(fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        warn(fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        error(fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    std::string decorate(const std::string& msg) const;

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> success_logger_;
    Context context_;
};

class LoggerGuard {
public:
    explicit LoggerGuard(Logger& logger) : logger_(logger) {}

    ~LoggerGuard() {
        logger_.shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

private:
    Logger& logger_;
};

}
