// =============================================================================
// Runnel - Simulation Worker
// =============================================================================
// Dedicated background thread that owns the WaterSimulation. Requests are
// consumed strictly in FIFO order between ticks; a tick is never
// interrupted by a request. While running, one step executes every
// stepIntervalMs and its water field is emitted as a WaterUpdateEvent.
//
// The event sink is invoked on the worker thread and must be thread-safe.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "core/Profiler.h"
#include "core/threading/MessageQueue.h"
#include "Messages.h"
#include "WaterConfig.h"
#include "WaterSimulation.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace Runnel {

using WorkerEventSink = std::function<void(WorkerEvent&&)>;

class SimulationWorker : public NonMoveable {
public:
    using Clock = std::chrono::steady_clock;

    explicit SimulationWorker(WorkerEventSink sink, const WaterSimConfig& config = {});
    ~SimulationWorker();

    // Spawns the worker thread. Idempotent while running; a worker that has
    // been shut down cannot be relaunched.
    bool launch();

    // Stops the loop after the current tick and joins the thread
    void shutdown();

    bool isLaunched() const { return m_thread.joinable(); }

    // Non-blocking. Returns false if the worker is not running.
    bool post(WorkerRequest&& request);

    u64 getStepsExecuted() const { return m_stepsExecuted.load(std::memory_order_relaxed); }

private:
    void threadMain();
    void handleRequest(WorkerRequest&& request);
    void tick();
    void emitWaterUpdate();
    void emit(WorkerEvent&& event);

    SimulationParams defaultParams() const;

    WorkerEventSink m_sink;
    WaterSimConfig m_config;
    MessageQueue<WorkerRequest> m_inbox;
    std::thread m_thread;
    std::atomic<u64> m_stepsExecuted{0};

    // Worker thread only
    WaterSimulation m_simulation;
    u64 m_generation = 0;
    Clock::time_point m_nextTick;
    StatisticsAccumulator m_stepTimes;
};

} // namespace Runnel
