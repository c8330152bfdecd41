/**
 * @file logger.h
 * @brief Stream-style logging shared by the cache, controller and scheduler
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-key cache events, per-group scheduling detail
    INFO,     ///< Lifecycle events (start/stop, limit changes)
    WARNING,  ///< Recoverable failures (load errors, failed groups)
    ERROR     ///< Failures that abort an operation
};

/**
 * @brief Thread-safe logger with severity levels
 *
 * Worker threads log concurrently, so every message is accumulated in a
 * LogStream and written in one piece under a mutex when the stream dies.
 *
 * Usage:
 * @code
 * Logger::debug() << "Cache miss for chunk " << key;
 * Logger::warning() << "Loader failed for " << key << ": " << e.what();
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        explicit LogStream(LogLevel level) : m_level(level) {}

        LogStream(LogStream&& other) noexcept
            : m_level(other.m_level), m_stream(std::move(other.m_stream)) {
            other.m_moved = true;
        }

        ~LogStream() {
            if (m_moved || m_level < s_minLevel) {
                return;
            }

            std::lock_guard<std::mutex> lock(s_mutex);
            std::ostream& out = (m_level >= LogLevel::WARNING) ? std::cerr : std::cout;
            out << prefix(m_level) << m_stream.str() << std::endl;
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_level >= s_minLevel) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        std::ostringstream m_stream;
        bool m_moved = false;
    };

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    /**
     * @brief Sets the minimum log level; messages below it are dropped
     */
    static void setMinLevel(LogLevel level) { s_minLevel = level; }
    static LogLevel minLevel() { return s_minLevel; }

    /**
     * @brief Enables or disables ANSI colour prefixes
     */
    static void setUseColors(bool enable) { s_useColors = enable; }

    /**
     * @brief Parses "debug", "info", "warning"/"warn" or "error" (case-insensitive)
     * @param name Level name from configuration
     * @param fallback Returned when the name is not recognised
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    static std::string prefix(LogLevel level);

    static LogLevel s_minLevel;
    static bool s_useColors;
    static std::mutex s_mutex;
};
