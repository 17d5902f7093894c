#include "../include/Callout/Logger.h"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Callout {

namespace {

// 2026-01-31T12:00:00.123Z
std::string FormatTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;

    std::tm utc = {};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

std::string FormatLine(const LogEntry& entry) {
    std::string line = FormatTimestamp(entry.timestamp) + " [" + Logger::levelName(entry.level) +
                       "] [" + entry.component + "] " + entry.message;
    if (!entry.details.empty()) {
        line += " | " + entry.details;
    }
    return line;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& logFilePath, LogLevel minLevel, bool enableConsole) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) {
        return true;
    }

    if (!logFilePath.empty()) {
        m_file.open(logFilePath, std::ios::app);
        if (!m_file.is_open()) {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
            return false;
        }
    }

    m_minLevel = minLevel;
    m_console = enableConsole;
    m_initialized = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
    m_initialized = false;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& details) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized || level < m_minLevel) {
        return;
    }

    LogEntry entry(level, component, message, details);
    if (m_file.is_open() || m_console) {
        std::string line = FormatLine(entry);
        if (m_file.is_open()) {
            m_file << line << '\n';
            m_file.flush();
        }
        if (m_console) {
            std::cerr << line << '\n';
        }
    }

    m_recent.push_back(std::move(entry));
    if (m_recent.size() > MAX_RECENT_ENTRIES) {
        m_recent.pop_front();
    }
}

std::vector<LogEntry> Logger::recentEntries(LogLevel atLeast) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<LogEntry> entries;
    for (const auto& entry : m_recent) {
        if (entry.level >= atLeast) {
            entries.push_back(entry);
        }
    }
    return entries;
}

void Logger::clearRecentEntries() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recent.clear();
}

bool Logger::isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

ScopedLogger::ScopedLogger(const std::string& component, const std::string& operation)
    : m_component(component), m_operation(operation), m_start(std::chrono::steady_clock::now()) {}

ScopedLogger::~ScopedLogger() {
    finish(LogLevel::DEBUG, "finished", "");
}

void ScopedLogger::addContext(const std::string& key, const std::string& value) {
    if (!m_context.empty()) {
        m_context += ", ";
    }
    m_context += key + "=" + value;
}

void ScopedLogger::success(const std::string& details) {
    finish(LogLevel::INFO, "succeeded", details);
}

void ScopedLogger::failure(const std::string& error) {
    finish(LogLevel::WARNING, "failed", error);
}

void ScopedLogger::finish(LogLevel level, const std::string& outcome, const std::string& details) {
    if (m_done) {
        return;
    }
    m_done = true;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - m_start)
                       .count();
    std::string logDetails = std::to_string(elapsed) + "ms";
    if (!details.empty()) {
        logDetails += " | " + details;
    }
    if (!m_context.empty()) {
        logDetails += " | " + m_context;
    }
    Logger::getInstance().log(level, m_component, m_operation + " " + outcome, logDetails);
}

} // namespace Callout
