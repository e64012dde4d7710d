#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace agentcli::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr; stdout belongs to command results.
    class Logger {
    public:
        // Singleton access so the whole engine shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) agentcli::core::logging::Logger::get().log(agentcli::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  agentcli::core::logging::Logger::get().log(agentcli::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  agentcli::core::logging::Logger::get().log(agentcli::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) agentcli::core::logging::Logger::get().log(agentcli::core::logging::LogLevel::ERROR, msg)

} // namespace agentcli::core::logging
