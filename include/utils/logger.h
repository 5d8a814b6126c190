#pragma once
/**
 * @file logger.h
 * @brief Logging utilities
 */

#include <string>

namespace btd6_pilot {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Set minimum log level
 */
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/**
 * @brief Parse "debug" / "INFO" / "warn" / ...; unknown text maps to INFO
 */
LogLevel parseLogLevel(const std::string& text);

/**
 * @brief Mirror every log line into a file (appended)
 * @param path Log file path; empty closes the current file
 * @return false if the file cannot be opened
 */
bool setLogFile(const std::string& path);

/**
 * @brief Log a message
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Convenience logging functions
 */
void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

} // namespace btd6_pilot
