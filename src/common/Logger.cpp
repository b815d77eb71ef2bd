#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
    thread_local std::string currentThreadName = "main";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : logLevel(LogLevel::INFO)
    , logToConsole(true)
    , logToFile(false)
    , maxFileBytes(5 * 1024 * 1024)
    , maxBackups(5)
    , currentFileBytes(0) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& path,
                  size_t maxBytes, int backups) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    logToConsole = enableConsoleLogging;
    maxFileBytes = maxBytes;
    maxBackups = backups;

    if (logFile.is_open()) {
        logFile.close();
    }

    if (!path.empty()) {
        logFilePath = path;
        logFile.open(logFilePath, std::ios::out | std::ios::app);
        logToFile = logFile.is_open();
        currentFileBytes = logToFile ? static_cast<size_t>(logFile.tellp()) : 0;
        if (!logToFile) {
            std::cerr << "[WARN] Could not open log file: " << logFilePath << std::endl;
        }
    } else {
        logFilePath.clear();
        logToFile = false;
        currentFileBytes = 0;
    }
}

void Logger::setLogLevel(LogLevel level) {
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::string output = timestamp() + " " + levelToString(level) +
                         " [" + currentThreadName + "] " + message;

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::cout << output << std::endl;
    }

    if (logToFile && logFile.is_open()) {
        rotateIfNeeded();
        logFile << output << '\n';
        logFile.flush();
        currentFileBytes += output.size() + 1;
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERR, message);
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
}

void Logger::setThreadName(const std::string& name) {
    currentThreadName = name;
}

const std::string& Logger::threadName() {
    return currentThreadName;
}

LogLevel Logger::parseLevel(const std::string& text, LogLevel fallback) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERR;
    if (lower == "none") return LogLevel::NONE;
    return fallback;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTm{};
    localtime_r(&nowTimeT, &localTm);

    std::ostringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
    return ss.str();
}

void Logger::rotateIfNeeded() {
    if (maxFileBytes == 0 || currentFileBytes < maxFileBytes) {
        return;
    }

    logFile.close();

    if (maxBackups > 0) {
        // Shift path.(N-1) -> path.N, ..., path -> path.1
        std::remove((logFilePath + "." + std::to_string(maxBackups)).c_str());
        for (int i = maxBackups - 1; i >= 1; --i) {
            std::string from = logFilePath + "." + std::to_string(i);
            std::string to = logFilePath + "." + std::to_string(i + 1);
            std::rename(from.c_str(), to.c_str());
        }
        std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
    } else {
        std::remove(logFilePath.c_str());
    }

    logFile.open(logFilePath, std::ios::out | std::ios::trunc);
    logToFile = logFile.is_open();
    currentFileBytes = 0;
}
