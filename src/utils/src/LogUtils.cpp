#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <string>
#include <memory>
#include <vector>
#include <filesystem>

namespace LogUtils {

const char* const SUCCESS_LOGGER_NAME = "taskrun_success";

namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug:   return spdlog::level::debug;
        case Level::Info:    return spdlog::level::info;
        case Level::Success: return spdlog::level::info;
        case Level::Warn:    return spdlog::level::warn;
        case Level::Error:   return spdlog::level::err;
        default:             return spdlog::level::info;
    }
}

// Success events travel at info severity through their own backend logger;
// the level column is chosen from the logger name.
class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE  ", "DEBUG  ", "INFO   ", "WARN   ", "ERROR  ", "FATAL  ", "OFF    "
        };
        static const char* success_name = "SUCCESS";

        const char* name = nullptr;
        if (std::string(msg.logger_name.data(), msg.logger_name.size()) == SUCCESS_LOGGER_NAME) {
            name = success_name;
        } else {
            auto lvl = static_cast<size_t>(msg.level);
            name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : level_names[2];
        }
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

std::unique_ptr<spdlog::formatter> make_formatter() {
    // The custom flag must exist before the pattern is compiled
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFullNameFormatter>('X').set_pattern("%Y-%m-%d %H:%M:%S %^%X%$ %v");
    return formatter;
}

}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "success") return Level::Success;
    if (lower == "warn") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

Logger Logger::create(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::filesystem::path log_path(log_file);
    std::filesystem::path parent_dir = log_path.parent_path();

    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

    Logger result;
    result.logger_ = std::make_shared<spdlog::async_logger>(
        "taskrun_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    result.success_logger_ = std::make_shared<spdlog::async_logger>(
        SUCCESS_LOGGER_NAME, sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    for (const auto& backend : {result.logger_, result.success_logger_}) {
        backend->set_formatter(make_formatter());
        backend->set_level(to_spdlog_level(level));
        backend->flush_on(spdlog::level::info);
    }
    return result;
}

void Logger::shutdown() {
    if (logger_) logger_->flush();
    if (success_logger_) success_logger_->flush();
    logger_.reset();
    success_logger_.reset();
    spdlog::shutdown();
}

void Logger::set_level(Level level) {
    if (logger_) logger_->set_level(to_spdlog_level(level));
    if (success_logger_) success_logger_->set_level(to_spdlog_level(level));
}

Logger Logger::child(const std::string& key, const std::string& value) const {
    Logger derived(*this);
    derived.context_.emplace_back(key, value);
    return derived;
}

std::string Logger::decorate(const std::string& msg) const {
    if (context_.empty()) return msg;

    std::string prefix;
    for (const auto& entry : context_) {
        prefix += "[" + entry.second + "] ";
    }
    return prefix + msg;
}

void Logger::debug(const std::string& msg) const {
    if (logger_) {
        logger_->debug(decorate(msg));
    } else {
        std::cout << "[DEBUG] " << decorate(msg) << std::endl;
    }
}

void Logger::info(const std::string& msg) const {
    if (logger_) {
        logger_->info(decorate(msg));
    } else {
        std::cout << "[INFO] " << decorate(msg) << std::endl;
    }
}

void Logger::success(const std::string& msg) const {
    if (success_logger_) {
        success_logger_->info(decorate(msg));
    } else {
        std::cout << "[SUCCESS] " << decorate(msg) << std::endl;
    }
}

void Logger::warn(const std::string& msg) const {
    if (logger_) {
        logger_->warn(decorate(msg));
    } else {
        std::cout << "[WARN] " << decorate(msg) << std::endl;
    }
}

void Logger::error(const std::string& msg) const {
    if (logger_) {
        logger_->error(decorate(msg));
    } else {
        std::cerr << "[ERROR] " << decorate(msg) << std::endl;
    }
}

}
