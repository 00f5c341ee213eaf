// =============================================================================
// Runnel - Assert Macros
// =============================================================================
// Debug-only checks for programmer errors such as out-of-range cell access.
// Bad input from callers is logged and rejected instead.
// =============================================================================

#pragma once

#include "Types.h"
#include "Log.h"
#include <cstdlib>

namespace Runnel {

[[noreturn]] inline void assertFailed(const char* expression, const char* message,
                                       const char* file, int line) {
    Logger::instance().log(LogLevel::Fatal, "Assert", file, line,
        "%s: %s", expression, message ? message : "assertion failed");

    RUNNEL_DEBUGBREAK();
    std::abort();
}

} // namespace Runnel

#if defined(NDEBUG) || defined(RUNNEL_DISABLE_ASSERTS)
    #define RUNNEL_ASSERT_MSG(expr, msg) ((void)0)
#else
    #define RUNNEL_ASSERT_MSG(expr, msg) \
        do { \
            if (RUNNEL_UNLIKELY(!(expr))) { \
                ::Runnel::assertFailed(#expr, msg, __FILE__, __LINE__); \
            } \
        } while (0)
#endif
