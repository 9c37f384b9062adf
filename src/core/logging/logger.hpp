#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace venvbox::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger. stdout carries results, so every line goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            log(level, "", message);
        }

        // Requests run concurrently, so the request id travels with each line
        // instead of living in shared logger state.
        void log(LogLevel level, const std::string& request_id, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }
            std::cerr << "[" << level_to_string(level) << "] "
                      << (request_id.empty() ? "" : "[" + request_id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::ERROR, msg)

    #define LOG_REQ_DEBUG(id, msg) venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::DEBUG, id, msg)
    #define LOG_REQ_INFO(id, msg)  venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::INFO, id, msg)
    #define LOG_REQ_WARN(id, msg)  venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::WARN, id, msg)
    #define LOG_REQ_ERROR(id, msg) venvbox::core::logging::Logger::get().log(venvbox::core::logging::LogLevel::ERROR, id, msg)

} // namespace venvbox::core::logging
