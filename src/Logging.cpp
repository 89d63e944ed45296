/*
 * PicoOSC - Open Sound Control over UDP.
 * Leveled logging to stderr, an optional log file and a callback.
 */

#include "picoosc/Logging.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

#include "picoosc/Exceptions.h"

namespace picoosc {
    namespace {
        std::mutex logMutex;
        std::atomic<LogLevel> currentLevel{LogLevel::Warning};
        std::FILE *logFile = nullptr;
        LogCallback logCallback;

        // Format "YYYY-MM-DD HH:MM:SS.mmm" in local time
        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch())
                              .count() %
                          1000;

            std::tm local{};
            localtime_r(&seconds, &local);

            char buffer[32];
            std::size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
            std::snprintf(buffer + len, sizeof(buffer) - len, ".%03d", static_cast<int>(millis));
            return buffer;
        }
    }  // namespace

    bool initLogging(const std::string &filename, bool debugEnabled) {
        std::lock_guard<std::mutex> lock(logMutex);

        if (logFile) {
            std::fclose(logFile);
            logFile = nullptr;
        }

        currentLevel = debugEnabled ? LogLevel::Debug : LogLevel::Info;

        if (filename.empty()) {
            return true;
        }

        logFile = std::fopen(filename.c_str(), "a");
        return logFile != nullptr;
    }

    void shutdownLogging() {
        std::lock_guard<std::mutex> lock(logMutex);
        if (logFile) {
            std::fclose(logFile);
            logFile = nullptr;
        }
    }

    void setLogLevel(LogLevel level) { currentLevel = level; }

    LogLevel getLogLevel() { return currentLevel; }

    void setLogCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(logMutex);
        logCallback = std::move(callback);
    }

    LogLevel logLevelFromString(const std::string &name) {
        if (name == "error") return LogLevel::Error;
        if (name == "warning" || name == "warn") return LogLevel::Warning;
        if (name == "info") return LogLevel::Info;
        if (name == "debug") return LogLevel::Debug;
        throw InvalidArgumentException("Unknown log level '" + name + "'");
    }

    const char *logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Warning:
                return "WARNING";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Debug:
                return "DEBUG";
        }
        return "UNKNOWN";
    }

    void logMessage(LogLevel level, const char *fmt, ...) {
        va_list args;
        va_start(args, fmt);
        logMessageV(level, fmt, args);
        va_end(args);
    }

    void logMessageV(LogLevel level, const char *fmt, va_list args) {
        if (static_cast<int>(level) > static_cast<int>(currentLevel.load())) {
            return;
        }

        // Measure first, then format into an exactly sized buffer
        va_list sizing;
        va_copy(sizing, args);
        int needed = std::vsnprintf(nullptr, 0, fmt, sizing);
        va_end(sizing);
        if (needed < 0) {
            return;
        }

        std::vector<char> text(static_cast<std::size_t>(needed) + 1);
        std::vsnprintf(text.data(), text.size(), fmt, args);
        std::string message(text.data(), static_cast<std::size_t>(needed));

        std::lock_guard<std::mutex> lock(logMutex);
        std::string line = timestamp() + " [" + logLevelName(level) + "] " + message;

        std::fprintf(stderr, "%s\n", line.c_str());
        if (logFile) {
            std::fprintf(logFile, "%s\n", line.c_str());
            std::fflush(logFile);
        }

        if (logCallback) {
            logCallback(level, message);
        }
    }

}  // namespace picoosc
