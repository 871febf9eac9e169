#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace toolgate::core::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3
    };

    // Process-wide logger. Writes to stderr so stdout stays free for tool output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level_;
        }

        // Tags every line, e.g. with the session id of a CLI invocation.
        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < level_) {
                return;
            }
            std::clog << "[" << level_to_string(level) << "] "
                      << (tag_.empty() ? "" : "[" + tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }

        mutable std::mutex mutex_;
        LogLevel level_ = LogLevel::INFO;
        std::string tag_;
    };

    #define LOG_DEBUG(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::ERROR, msg)

} // namespace toolgate::core::logging
