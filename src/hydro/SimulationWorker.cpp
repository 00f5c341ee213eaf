// =============================================================================
// Runnel - Simulation Worker Implementation
// =============================================================================

#include "SimulationWorker.h"
#include "core/Log.h"
#include <system_error>

namespace Runnel {

SimulationWorker::SimulationWorker(WorkerEventSink sink, const WaterSimConfig& config)
    : m_sink(std::move(sink))
    , m_config(config)
{
}

SimulationWorker::~SimulationWorker() {
    shutdown();
}

bool SimulationWorker::launch() {
    if (m_thread.joinable()) {
        return true;
    }
    if (m_inbox.isClosed()) {
        RUNNEL_LOG_WARN("SimWorker", "Worker was shut down and cannot be relaunched");
        return false;
    }
    if (m_config.stepIntervalMs == 0) {
        RUNNEL_LOG_ERROR("SimWorker", "Step interval must be positive");
        return false;
    }

    try {
        m_thread = std::thread(&SimulationWorker::threadMain, this);
    } catch (const std::system_error& e) {
        RUNNEL_LOG_ERROR("SimWorker", "Failed to create worker thread: %s", e.what());
        return false;
    }

    RUNNEL_LOG_DEBUG("SimWorker", "Launched (tick %u ms)", m_config.stepIntervalMs);
    return true;
}

void SimulationWorker::shutdown() {
    if (!m_thread.joinable()) {
        return;
    }

    m_inbox.close();
    m_thread.join();

    RUNNEL_LOG_INFO("SimWorker", "Shut down after %llu steps (min %.3f / mean %.3f / max %.3f ms)",
        static_cast<unsigned long long>(m_stepTimes.count()),
        m_stepTimes.min(), m_stepTimes.mean(), m_stepTimes.max());
}

bool SimulationWorker::post(WorkerRequest&& request) {
    if (!m_thread.joinable()) {
        RUNNEL_LOG_DEBUG("SimWorker", "Dropping '%s' request, worker not running",
            requestName(request));
        return false;
    }
    return m_inbox.push(std::move(request));
}

void SimulationWorker::threadMain() {
    RUNNEL_PROFILE_THREAD("SimulationWorker");

    emit(LoadedEvent{});

    while (true) {
        WorkerRequest request;
        bool received = m_simulation.isRunning()
            ? m_inbox.waitPopUntil(request, m_nextTick)
            : m_inbox.waitPop(request);

        if (received) {
            handleRequest(std::move(request));
        } else if (m_inbox.isClosed()) {
            break;
        }

        // Checked after every request too, so a busy inbox cannot starve ticks
        if (m_simulation.isRunning() && Clock::now() >= m_nextTick) {
            tick();
        }
    }

    m_simulation.release();
}

void SimulationWorker::handleRequest(WorkerRequest&& request) {
    RUNNEL_LOG_TRACE("SimWorker", "Handling '%s'", requestName(request));

    std::visit(Overloaded{
        [this](InitRequest& init) {
            u32 width = init.width;
            u32 height = init.height;
            if (!m_simulation.initialize(std::move(init.elevation), width, height, init.cellSize)) {
                return;
            }
            m_generation = init.generation;
            m_simulation.setParams(defaultParams());
            emit(ReadyEvent{width, height, m_generation});
        },
        [this](StartRequest&) {
            if (m_simulation.isRunning()) {
                return;
            }
            m_simulation.setRunning(true);
            m_nextTick = Clock::now();
        },
        [this](StopRequest&) {
            m_simulation.setRunning(false);
        },
        [this](StartRainRequest&) {
            m_simulation.setRaining(true);
        },
        [this](StopRainRequest&) {
            m_simulation.setRaining(false);
        },
        [this](ResetRequest&) {
            m_simulation.reset();
            emitWaterUpdate();
        },
        [this](SetParamsRequest& params) {
            SimulationParams p = defaultParams();
            p.rainRate = params.rainRate;
            p.evaporation = params.evaporation;
            p.infiltration = params.infiltration;
            p.flowRate = params.flowRate;
            m_simulation.setParams(p);
        },
    }, request);
}

void SimulationWorker::tick() {
    if (m_simulation.isInitialized()) {
        f64 stepMs = 0.0;
        {
            ScopedTimer timer("SimulationWorker::tick", &stepMs);
            m_simulation.step();
        }
        m_stepTimes.addSample(stepMs);
        m_stepsExecuted.fetch_add(1, std::memory_order_relaxed);

        RUNNEL_PROFILE_PLOT("Water volume (m3)", m_simulation.totalWaterVolume());
        emitWaterUpdate();
    }

    m_nextTick = Clock::now() + std::chrono::milliseconds(m_config.stepIntervalMs);
}

void SimulationWorker::emitWaterUpdate() {
    if (!m_simulation.isInitialized()) {
        return;
    }

    WaterUpdateEvent update;
    update.grid = m_simulation.snapshotWater();
    update.width = m_simulation.getWidth();
    update.height = m_simulation.getHeight();
    update.step = m_simulation.getStepCount();
    update.generation = m_generation;
    emit(std::move(update));
}

void SimulationWorker::emit(WorkerEvent&& event) {
    if (m_sink) {
        m_sink(std::move(event));
    }
}

SimulationParams SimulationWorker::defaultParams() const {
    SimulationParams params;
    params.flowRate = m_config.flowRate;
    params.minFlowThreshold = m_config.minFlowThreshold;
    return params;
}

} // namespace Runnel
