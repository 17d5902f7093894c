#pragma once

#include "CalloutTypes.h"
#include <chrono>
#include <deque>
#include <fstream>
#include <mutex>
#include <vector>

namespace Callout {

/**
 * @brief Process-wide logger for the library and the command-line tool
 *
 * Lines are written synchronously, so everything logged is on disk when a
 * short-lived command exits. Logging before initialize() is a no-op.
 * Console output goes to stderr; stdout carries the tool's JSON.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Open the log sinks
     * @param logFilePath File to append to (empty for no file)
     * @param minLevel Entries below this level are dropped
     * @param enableConsole Also echo lines to stderr
     * @return false if the file could not be opened
     */
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO,
                    bool enableConsole = false);

    void shutdown();

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& details = "");

    // Entries kept since the last clear at or above atLeast, oldest first
    std::vector<LogEntry> recentEntries(LogLevel atLeast = LogLevel::DEBUG) const;
    void clearRecentEntries();

    bool isInitialized() const;

    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    bool m_initialized = false;
    LogLevel m_minLevel = LogLevel::INFO;
    bool m_console = false;
    std::ofstream m_file;
    std::deque<LogEntry> m_recent;

    static constexpr size_t MAX_RECENT_ENTRIES = 256;
};

/**
 * @brief Times one operation and logs its outcome on completion
 *
 * An operation that ends without success() or failure() is logged at DEBUG
 * when the scope exits.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& component, const std::string& operation);
    ~ScopedLogger();

    void addContext(const std::string& key, const std::string& value);
    void success(const std::string& details = "");
    void failure(const std::string& error);

private:
    void finish(LogLevel level, const std::string& outcome, const std::string& details);

    std::string m_component;
    std::string m_operation;
    std::string m_context;
    std::chrono::steady_clock::time_point m_start;
    bool m_done = false;
};

} // namespace Callout

#define CALLOUT_LOG_DEBUG(component, message, ...) \
    Callout::Logger::getInstance().log(Callout::LogLevel::DEBUG, component, message, ##__VA_ARGS__)

#define CALLOUT_LOG_INFO(component, message, ...) \
    Callout::Logger::getInstance().log(Callout::LogLevel::INFO, component, message, ##__VA_ARGS__)

#define CALLOUT_LOG_WARNING(component, message, ...) \
    Callout::Logger::getInstance().log(Callout::LogLevel::WARNING, component, message, ##__VA_ARGS__)

#define CALLOUT_LOG_ERROR(component, message, ...) \
    Callout::Logger::getInstance().log(Callout::LogLevel::ERROR, component, message, ##__VA_ARGS__)

#define CALLOUT_SCOPED_LOG(component, operation) \
    Callout::ScopedLogger _scopedLogger(component, operation)
