#include "driftwatch/logger.hpp"
#include <cctype>

namespace driftwatch {

LogLevel Logger::level_ = LogLevel::Info;
std::mutex Logger::mutex_;

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lower = text;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug") level = LogLevel::Debug;
    else if (lower == "info") level = LogLevel::Info;
    else if (lower == "warning" || lower == "warn") level = LogLevel::Warning;
    else if (lower == "error") level = LogLevel::Error;
    else return false;
    return true;
}

} // namespace driftwatch
