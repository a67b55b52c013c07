#pragma once

#include <string>
#include <mutex>

namespace cadence {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    // An empty logPath logs to the console only
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static void log(LogLevel level, const std::string& message);
    static bool isInitialized() { return initialized_; }

    // Case-insensitive; "warn" and "critical" are accepted as aliases
    static bool parseLogLevel(const std::string& text, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static std::string logPath_;
};

} // namespace cadence
