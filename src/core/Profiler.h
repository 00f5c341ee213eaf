// =============================================================================
// Runnel - Profiler Integration
// =============================================================================
// Tracy zones for the simulation thread, plus lightweight step timing that
// works without Tracy
// =============================================================================

#pragma once

#include "Types.h"
#include "Log.h"
#include <algorithm>
#include <chrono>
#include <limits>

// =============================================================================
// Tracy Profiler Integration
// =============================================================================

#if defined(RUNNEL_ENABLE_PROFILING) && RUNNEL_ENABLE_PROFILING
    #include <tracy/Tracy.hpp>
    #define RUNNEL_PROFILER_ENABLED 1
#else
    #define RUNNEL_PROFILER_ENABLED 0
#endif

// =============================================================================
// Profiling Macros
// =============================================================================

#if RUNNEL_PROFILER_ENABLED

    #define RUNNEL_PROFILE_SCOPE_NAMED(name)   ZoneScopedN(name)
    #define RUNNEL_PROFILE_PLOT(name, value)   TracyPlot(name, value)
    #define RUNNEL_PROFILE_THREAD(name)        tracy::SetThreadName(name)

#else

    #define RUNNEL_PROFILE_SCOPE_NAMED(name)
    #define RUNNEL_PROFILE_PLOT(name, value)
    #define RUNNEL_PROFILE_THREAD(name)

#endif

// =============================================================================
// Scoped Timer
// =============================================================================

namespace Runnel {

class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    explicit ScopedTimer(const char* name, f64* outMs = nullptr)
        : m_name(name)
        , m_start(Clock::now())
        , m_outMs(outMs)
    {}

    ~ScopedTimer() {
        auto end = Clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
        f64 ms = static_cast<f64>(duration.count()) / 1000.0;

        if (m_outMs) {
            *m_outMs = ms;
        }

        RUNNEL_LOG_TRACE("Timer", "%s: %.3f ms", m_name, ms);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* m_name;
    TimePoint m_start;
    f64* m_outMs;
};

// =============================================================================
// Statistics Accumulator
// =============================================================================

// Running min/mean/max of step durations
class StatisticsAccumulator {
public:
    void addSample(f64 value) {
        m_count++;
        m_sum += value;
        m_min = std::min(m_min, value);
        m_max = std::max(m_max, value);
    }

    u64 count() const { return m_count; }
    f64 mean() const { return m_count > 0 ? m_sum / static_cast<f64>(m_count) : 0; }
    f64 min() const { return m_count > 0 ? m_min : 0; }
    f64 max() const { return m_count > 0 ? m_max : 0; }

private:
    u64 m_count = 0;
    f64 m_sum = 0;
    f64 m_min = std::numeric_limits<f64>::max();
    f64 m_max = std::numeric_limits<f64>::lowest();
};

} // namespace Runnel
