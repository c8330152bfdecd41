/**
 * @file logger.cpp
 * @brief Implementation of the logging system
 */

#include "logger.h"
#include <algorithm>
#include <cctype>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
std::mutex Logger::s_mutex;

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

std::string Logger::prefix(LogLevel level) {
    if (s_useColors) {
        switch (level) {
            case LogLevel::DEBUG:   return "\033[36m[DEBUG]\033[0m ";
            case LogLevel::INFO:    return "\033[32m[INFO]\033[0m ";
            case LogLevel::WARNING: return "\033[33m[WARNING]\033[0m ";
            case LogLevel::ERROR:   return "\033[31m[ERROR]\033[0m ";
        }
    }

    switch (level) {
        case LogLevel::DEBUG:   return "[DEBUG] ";
        case LogLevel::INFO:    return "[INFO] ";
        case LogLevel::WARNING: return "[WARNING] ";
        case LogLevel::ERROR:   return "[ERROR] ";
    }
    return "";
}
