// =============================================================================
// Runnel - Logging System
// =============================================================================
// Thread-safe logging with severity levels and multiple outputs
// =============================================================================

#pragma once

#include "Types.h"
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <atomic>
#include <chrono>

namespace Runnel {

// =============================================================================
// Log Severity Levels
// =============================================================================

enum class LogLevel : u8 {
    Trace = 0,   // Extremely verbose, for debugging only
    Debug,       // Debug information
    Info,        // General information
    Warn,        // Warnings
    Error,       // Errors that don't stop execution
    Fatal,       // Fatal errors that require shutdown
    Off          // Disable logging
};

constexpr const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "?????";
    }
}

constexpr const char* logLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";    // Gray
        case LogLevel::Debug: return "\033[36m";    // Cyan
        case LogLevel::Info:  return "\033[32m";    // Green
        case LogLevel::Warn:  return "\033[33m";    // Yellow
        case LogLevel::Error: return "\033[31m";    // Red
        case LogLevel::Fatal: return "\033[35;1m";  // Bright Magenta
        default:              return "\033[0m";     // Reset
    }
}

// =============================================================================
// Logger Class
// =============================================================================

class Logger : public NonCopyable {
public:
    static Logger& instance() {
        static Logger s_instance;
        return s_instance;
    }

    void setLevel(LogLevel level) { m_minLevel.store(level, std::memory_order_relaxed); }
    LogLevel getLevel() const { return m_minLevel.load(std::memory_order_relaxed); }

    void enableColors(bool enable) { m_useColors.store(enable, std::memory_order_relaxed); }
    void enableTimestamps(bool enable) { m_showTimestamps.store(enable, std::memory_order_relaxed); }

    void setOutput(FILE* file) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_output = file ? file : stderr;
    }

    void log(LogLevel level, const char* category, const char* file, int line,
             const char* format, ...)
#if !RUNNEL_COMPILER_MSVC
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    // Statistics (counted only for messages that pass the level filter)
    usize getLogCount() const;
    usize getWarningCount() const;
    usize getErrorCount() const;
    void resetStatistics();

private:
    Logger();

    void logImpl(LogLevel level, const char* category, const char* file, int line,
                 const char* format, va_list args);

    #if RUNNEL_PLATFORM_WINDOWS
    void enableWindowsAnsiColors();
    #endif

    FILE* m_output;
    mutable std::mutex m_mutex;
    std::atomic<LogLevel> m_minLevel;
    std::atomic<bool> m_useColors;
    std::atomic<bool> m_showTimestamps;
    std::chrono::steady_clock::time_point m_startTime;

    usize m_logCount = 0;
    usize m_warningCount = 0;
    usize m_errorCount = 0;
};

} // namespace Runnel

// =============================================================================
// Logging Macros
// =============================================================================

#define RUNNEL_LOG(level, category, ...) \
    ::Runnel::Logger::instance().log(level, category, __FILE__, __LINE__, __VA_ARGS__)

#define RUNNEL_LOG_TRACE(category, ...) RUNNEL_LOG(::Runnel::LogLevel::Trace, category, __VA_ARGS__)
#define RUNNEL_LOG_DEBUG(category, ...) RUNNEL_LOG(::Runnel::LogLevel::Debug, category, __VA_ARGS__)
#define RUNNEL_LOG_INFO(category, ...)  RUNNEL_LOG(::Runnel::LogLevel::Info, category, __VA_ARGS__)
#define RUNNEL_LOG_WARN(category, ...)  RUNNEL_LOG(::Runnel::LogLevel::Warn, category, __VA_ARGS__)
#define RUNNEL_LOG_ERROR(category, ...) RUNNEL_LOG(::Runnel::LogLevel::Error, category, __VA_ARGS__)
#define RUNNEL_LOG_FATAL(category, ...) RUNNEL_LOG(::Runnel::LogLevel::Fatal, category, __VA_ARGS__)
