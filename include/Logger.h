#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <sstream>
#include <cstddef>
#include <atomic>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERR instead of ERROR to avoid conflict with system macros
    NONE = 5     // No logging
};

class Logger {
public:
    static Logger& getInstance();

    // Initialize the logger. When logFilePath is set, the file is rotated once it
    // grows past maxFileBytes, keeping up to maxBackups old files (path.1 .. path.N).
    void init(LogLevel level = LogLevel::INFO,
              bool enableConsoleLogging = true,
              const std::string& logFilePath = "",
              size_t maxFileBytes = 5 * 1024 * 1024,
              int maxBackups = 5);

    // Set log level
    void setLogLevel(LogLevel level);

    // Check if a given log level is enabled
    bool isEnabled(LogLevel level) const;

    // Log a message with a specific level
    void log(LogLevel level, const std::string& message);

    // Helper methods for different log levels
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Close log file if open
    void close();

    // Name the calling thread in log lines ("main", "worker-3", ...)
    static void setThreadName(const std::string& name);
    static const std::string& threadName();

    // Parse "trace", "debug", "info", "warning", "error", "none" (case-insensitive)
    static LogLevel parseLevel(const std::string& text, LogLevel fallback = LogLevel::INFO);

    ~Logger();

    // Get current log level
    LogLevel getLogLevel() const {
        return logLevel;
    }

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Convert log level to string
    std::string levelToString(LogLevel level) const;

    // Current local time as "YYYY-mm-dd HH:MM:SS.mmm"
    std::string timestamp() const;

    // Caller must hold mutex
    void rotateIfNeeded();

    std::atomic<LogLevel> logLevel;
    bool logToConsole;
    bool logToFile;
    std::string logFilePath;
    size_t maxFileBytes;
    int maxBackups;
    size_t currentFileBytes;
    std::ofstream logFile;
    std::mutex mutex;
};

// Convenience macros for logging
#define LOG_TRACE(message) Logger::getInstance().trace(message)
#define LOG_DEBUG(message) Logger::getInstance().debug(message)
#define LOG_INFO(message) Logger::getInstance().info(message)
#define LOG_WARNING(message) Logger::getInstance().warning(message)
#define LOG_ERROR(message) Logger::getInstance().error(message)

// Stream-style logging macros
#define LOG_TRACE_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::TRACE)) { std::stringstream ss; ss << message; Logger::getInstance().trace(ss.str()); } }
#define LOG_DEBUG_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) { std::stringstream ss; ss << message; Logger::getInstance().debug(ss.str()); } }
#define LOG_INFO_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::INFO)) { std::stringstream ss; ss << message; Logger::getInstance().info(ss.str()); } }
#define LOG_WARNING_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::WARNING)) { std::stringstream ss; ss << message; Logger::getInstance().warning(ss.str()); } }
#define LOG_ERROR_STREAM(message) { if (Logger::getInstance().isEnabled(LogLevel::ERR)) { std::stringstream ss; ss << message; Logger::getInstance().error(ss.str()); } }
