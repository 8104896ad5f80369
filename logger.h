#pragma once

#include <string>

namespace untis {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

struct LoggerSettings {
    std::string filePath = "untis_board.log"; // пусто = без файла
    LogLevel    minLevel = LogLevel::Info;
};

void configureLogger(const LoggerSettings& settings);

// "debug" / "info" / "warn" / "error", иначе Info
LogLevel parseLogLevel(const std::string& name);

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);

} // namespace untis
