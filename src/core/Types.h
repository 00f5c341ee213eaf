// =============================================================================
// Runnel - Core Types
// =============================================================================
// Fixed-width aliases, compiler detection and ownership markers
// =============================================================================

#pragma once

#include <cstdint>
#include <cstddef>

namespace Runnel {

// =============================================================================
// Fixed-Width Integer Types
// =============================================================================

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// =============================================================================
// Compiler Detection
// =============================================================================

#if defined(_MSC_VER)
    #define RUNNEL_COMPILER_MSVC 1
#elif defined(__clang__)
    #define RUNNEL_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define RUNNEL_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

// =============================================================================
// Platform Macros
// =============================================================================

#if defined(RUNNEL_PLATFORM_WINDOWS)
    #define RUNNEL_DEBUGBREAK() __debugbreak()
#elif defined(RUNNEL_PLATFORM_LINUX) || defined(RUNNEL_PLATFORM_MACOS)
    #define RUNNEL_DEBUGBREAK() __builtin_trap()
#else
    #define RUNNEL_DEBUGBREAK() ((void)0)
#endif

// =============================================================================
// Branch Hints
// =============================================================================

#if RUNNEL_COMPILER_MSVC
    #define RUNNEL_UNLIKELY(x) (x)
#else
    #define RUNNEL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

// =============================================================================
// Non-Copyable / Non-Moveable Base Classes
// =============================================================================

class NonCopyable {
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

class NonMoveable : public NonCopyable {
protected:
    NonMoveable() = default;
    ~NonMoveable() = default;

    NonMoveable(NonMoveable&&) = delete;
    NonMoveable& operator=(NonMoveable&&) = delete;
};

} // namespace Runnel
