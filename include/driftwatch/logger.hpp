#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace driftwatch {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);
bool parse_log_level(const std::string& text, LogLevel& level);

class Logger {
public:
    static void set_level(LogLevel level) { level_ = level; }
    static LogLevel level() { return level_; }
    static bool is_enabled(LogLevel level) { return level >= level_; }

    template<typename... Args>
    static void debug(Args&&... args) { write(LogLevel::Debug, std::forward<Args>(args)...); }

    template<typename... Args>
    static void info(Args&&... args) { write(LogLevel::Info, std::forward<Args>(args)...); }

    template<typename... Args>
    static void warning(Args&&... args) { write(LogLevel::Warning, std::forward<Args>(args)...); }

    template<typename... Args>
    static void error(Args&&... args) { write(LogLevel::Error, std::forward<Args>(args)...); }

    template<typename... Args>
    static void write(LogLevel level, Args&&... args) {
        if (!is_enabled(level)) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[" << to_string(level) << "] ";
        ((std::cerr << args), ...);
        std::cerr << std::endl;
    }

private:
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace driftwatch
