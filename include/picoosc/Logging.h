/*
 *  PicoOSC - Open Sound Control over UDP.
 *  Leveled logging used by the server, dispatcher and client.
 */

#pragma once

#include <cstdarg>
#include <functional>
#include <string>

namespace picoosc {

    /**
     * @brief Log levels, most severe first
     */
    enum class LogLevel {
        Error = 0,    ///< Critical errors (always logged)
        Warning = 1,  ///< Warnings (always logged)
        Info = 2,     ///< Informational messages
        Debug = 3     ///< Debug messages
    };

    /**
     * @brief Callback receiving every emitted log line
     */
    using LogCallback = std::function<void(LogLevel level, const std::string &message)>;

    /**
     * @brief Initialize the logging system
     *
     * @param filename Path to log file (empty for stderr only)
     * @param debugEnabled Whether to enable debug-level logging
     * @return true on success, false if the log file could not be opened
     */
    bool initLogging(const std::string &filename, bool debugEnabled);

    /**
     * @brief Close the log file, if any
     */
    void shutdownLogging();

    /**
     * @brief Set the maximum level that is emitted
     */
    void setLogLevel(LogLevel level);

    /**
     * @brief Get the current log level
     */
    LogLevel getLogLevel();

    /**
     * @brief Install (or clear, with nullptr) a callback notified for each log line
     * @note The callback runs under the logging lock and must not log itself.
     */
    void setLogCallback(LogCallback callback);

    /**
     * @brief Parse a level name ("error", "warning", "info", "debug")
     * @throws InvalidArgumentException for unknown names
     */
    LogLevel logLevelFromString(const std::string &name);

    /**
     * @brief Name of a log level
     */
    const char *logLevelName(LogLevel level);

    /**
     * @brief Log a message
     *
     * @param level The log level
     * @param fmt Printf-style format string
     * @param ... Format arguments
     */
    void logMessage(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    /**
     * @brief Log a message with a va_list
     */
    void logMessageV(LogLevel level, const char *fmt, va_list args);

}  // namespace picoosc

// Convenience macros
#define PICOOSC_LOG_ERROR(fmt, ...) ::picoosc::logMessage(::picoosc::LogLevel::Error, fmt, ##__VA_ARGS__)
#define PICOOSC_LOG_WARNING(fmt, ...) \
    ::picoosc::logMessage(::picoosc::LogLevel::Warning, fmt, ##__VA_ARGS__)
#define PICOOSC_LOG_INFO(fmt, ...) ::picoosc::logMessage(::picoosc::LogLevel::Info, fmt, ##__VA_ARGS__)
#define PICOOSC_LOG_DEBUG(fmt, ...) ::picoosc::logMessage(::picoosc::LogLevel::Debug, fmt, ##__VA_ARGS__)
