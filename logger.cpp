#include "logger.h"
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <mutex>

namespace untis {

namespace {
    std::ofstream logFile;
    std::mutex logMutex;
    LoggerSettings current;
    bool initialized = false;

    std::string levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    std::string currentTimeString() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
    #if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return std::string(buf);
    }

    void ensureInitialized() {
        if (!initialized) {
            if (!current.filePath.empty()) {
                logFile.open(current.filePath, std::ios::out | std::ios::app);
            }
            initialized = true;
        }
    }
}

void configureLogger(const LoggerSettings& settings) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    current = settings;
    initialized = false;
}

LogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void logMessage(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (level < current.minLevel) {
        return;
    }
    ensureInitialized();

    std::string timeStr  = currentTimeString();
    std::string levelStr = levelToString(level);

    std::string full = "[" + timeStr + "][" + levelStr + "] " + msg + "\n";

    if (logFile.is_open()) {
        logFile << full;
        logFile.flush();
    }

    // stdout занят выводом расписания, лог только в stderr
    std::cerr << full;
}

void logInfo(const std::string& msg)    { logMessage(LogLevel::Info, msg); }
void logWarning(const std::string& msg) { logMessage(LogLevel::Warning, msg); }
void logError(const std::string& msg)   { logMessage(LogLevel::Error, msg); }
void logDebug(const std::string& msg)   { logMessage(LogLevel::Debug, msg); }

} // namespace untis
