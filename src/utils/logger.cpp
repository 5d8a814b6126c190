/**
 * @file logger.cpp
 * @brief Logging utilities
 */

#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace btd6_pilot {

namespace {

LogLevel g_minLogLevel = LogLevel::INFO;
std::mutex g_logMutex;
std::ofstream g_logFile;

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &time);
#else
    localtime_r(&time, &tmBuf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_minLogLevel = level;
}

LogLevel getLogLevel() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_minLogLevel;
}

LogLevel parseLogLevel(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::toupper(c); });
    if (s == "DEBUG") return LogLevel::DEBUG;
    if (s == "WARNING" || s == "WARN") return LogLevel::WARNING;
    if (s == "ERROR" || s == "CRITICAL") return LogLevel::ERROR;
    return LogLevel::INFO;
}

bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) g_logFile.close();
    if (path.empty()) return true;
    g_logFile.open(path, std::ios::app);
    return g_logFile.is_open();
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level < g_minLogLevel) return;

    const char* levelStr = "";
    switch (level) {
        case LogLevel::DEBUG:   levelStr = "[DEBUG]"; break;
        case LogLevel::INFO:    levelStr = "[INFO]"; break;
        case LogLevel::WARNING: levelStr = "[WARN]"; break;
        case LogLevel::ERROR:   levelStr = "[ERROR]"; break;
    }

    const std::string line = getTimestamp() + " " + levelStr + " " + message;
    std::cout << line << std::endl;
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }
}

void logDebug(const std::string& message) { log(LogLevel::DEBUG, message); }
void logInfo(const std::string& message) { log(LogLevel::INFO, message); }
void logWarning(const std::string& message) { log(LogLevel::WARNING, message); }
void logError(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace btd6_pilot
