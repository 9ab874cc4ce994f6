#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace agui::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Records go to stderr; stdout belongs to whatever data the tool prints.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& thread_id, const std::string& run_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            thread_id_ = thread_id;
            run_id_ = run_id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
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
                      << context_prefix()
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
        std::string thread_id_;
        std::string run_id_;

        std::string context_prefix() const {
            if (thread_id_.empty() && run_id_.empty()) {
                return "";
            }
            return "[" + thread_id_ + "/" + run_id_ + "] ";
        }

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

    // 3. Helper macros
    #define AGUI_LOG_DEBUG(msg) agui::core::logging::Logger::get().log(agui::core::logging::LogLevel::DEBUG, msg)
    #define AGUI_LOG_INFO(msg)  agui::core::logging::Logger::get().log(agui::core::logging::LogLevel::INFO, msg)
    #define AGUI_LOG_WARN(msg)  agui::core::logging::Logger::get().log(agui::core::logging::LogLevel::WARN, msg)
    #define AGUI_LOG_ERROR(msg) agui::core::logging::Logger::get().log(agui::core::logging::LogLevel::ERROR, msg)

} // namespace agui::core::logging
