// =============================================================================
// Runnel - Logging System Implementation
// =============================================================================

#include "Log.h"

#if RUNNEL_PLATFORM_WINDOWS
#include <windows.h>
#endif

namespace Runnel {

Logger::Logger()
    : m_output(stderr)
    , m_minLevel(LogLevel::Info)
    , m_useColors(true)
    , m_showTimestamps(true)
{
    m_startTime = std::chrono::steady_clock::now();

    #if RUNNEL_PLATFORM_WINDOWS
    // Enable ANSI colors on Windows 10+
    enableWindowsAnsiColors();
    #endif
}

void Logger::log(LogLevel level, const char* category, const char* file, int line,
                 const char* format, ...) {
    if (level < getLevel() || level == LogLevel::Off) return;

    va_list args;
    va_start(args, format);
    logImpl(level, category, file, line, format, args);
    va_end(args);
}

void Logger::logImpl(LogLevel level, const char* category, const char* file, int line,
                     const char* format, va_list args) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_logCount++;
    if (level == LogLevel::Warn) m_warningCount++;
    if (level >= LogLevel::Error) m_errorCount++;

    // Timestamp
    if (m_showTimestamps.load(std::memory_order_relaxed)) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - m_startTime
        ).count();
        std::fprintf(m_output, "[%8lld.%03lld] ",
            static_cast<long long>(elapsed / 1000),
            static_cast<long long>(elapsed % 1000));
    }

    // Level with color
    if (m_useColors.load(std::memory_order_relaxed)) {
        std::fprintf(m_output, "%s[%s]\033[0m ",
            logLevelColor(level), logLevelToString(level));
    } else {
        std::fprintf(m_output, "[%s] ", logLevelToString(level));
    }

    // Category
    if (category && category[0] != '\0') {
        std::fprintf(m_output, "[%s] ", category);
    }

    // Message
    std::vfprintf(m_output, format, args);

    // File and line for warnings and above
    if (level >= LogLevel::Warn && file) {
        // Extract just the filename
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') filename = p + 1;
        }
        std::fprintf(m_output, " (%s:%d)", filename, line);
    }

    std::fprintf(m_output, "\n");
    std::fflush(m_output);
}

usize Logger::getLogCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_logCount;
}

usize Logger::getWarningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_warningCount;
}

usize Logger::getErrorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorCount;
}

void Logger::resetStatistics() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logCount = 0;
    m_warningCount = 0;
    m_errorCount = 0;
}

#if RUNNEL_PLATFORM_WINDOWS
void Logger::enableWindowsAnsiColors() {
    // Enable ANSI escape sequences on Windows 10+
    HANDLE hConsole = GetStdHandle(STD_ERROR_HANDLE);
    if (hConsole != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hConsole, &mode)) {
            mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hConsole, mode);
        }
    }
}
#endif

} // namespace Runnel
