// =============================================================================
// Runnel - Water Coordinator Implementation
// =============================================================================

#include "WaterCoordinator.h"
#include "core/Log.h"
#include "Physics.h"
#include <algorithm>

namespace Runnel {

WaterCoordinator::WaterCoordinator(const WaterSimConfig& config)
    : m_config(config)
    , m_resolutionCm(config.resolutionCm)
    , m_rainRateMmHr(Physics::sanitizeRate(config.rainRateMmHr))
    , m_evaporationMmHr(Physics::sanitizeRate(config.evaporationMmHr))
    , m_infiltrationMmHr(Physics::sanitizeRate(config.infiltrationMmHr))
    , m_flowRate(Physics::clampFlowRateSetting(config.flowRate))
{
}

WaterCoordinator::~WaterCoordinator() {
    shutdown();
}

bool WaterCoordinator::initialize() {
    if (m_worker) {
        return true;
    }
    if (m_workerFailed) {
        return false;
    }

    auto worker = std::make_unique<SimulationWorker>(
        [this](WorkerEvent&& event) { m_events.push(std::move(event)); },
        m_config);

    if (!worker->launch()) {
        m_workerFailed = true;
        RUNNEL_LOG_ERROR("WaterCoordinator", "Water simulation unavailable");
        return false;
    }

    m_worker = std::move(worker);
    RUNNEL_LOG_INFO("WaterCoordinator", "Simulation worker created");
    return true;
}

void WaterCoordinator::shutdown() {
    if (!m_worker) {
        return;
    }
    m_worker->shutdown();
    m_worker.reset();
    m_workerReady = false;
    m_running = false;
    m_raining = false;
}

// =============================================================================
// Terrain
// =============================================================================

void WaterCoordinator::setTerrain(TerrainData terrain) {
    if (!terrain.isValid()) {
        RUNNEL_LOG_WARN("WaterCoordinator", "Ignoring terrain %ux%u with %zu elevation values",
            terrain.width, terrain.height, terrain.elevation.size());
        return;
    }

    m_terrain = std::move(terrain);

    // Full re-init, never a partial update
    if (m_worker) {
        m_workerReady = false;
        m_waterGrid.clear();
        sendElevationData();
    }
}

void WaterCoordinator::setResolution(f32 resolutionCm) {
    if (!(resolutionCm > 0.0f)) {
        RUNNEL_LOG_WARN("WaterCoordinator", "Ignoring invalid resolution %.3f cm",
            static_cast<f64>(resolutionCm));
        return;
    }
    if (resolutionCm == m_resolutionCm) {
        return;
    }

    m_resolutionCm = resolutionCm;

    if (m_worker && hasTerrain()) {
        m_workerReady = false;
        m_waterGrid.clear();
        sendElevationData();
    }
}

bool WaterCoordinator::sendElevationData() {
    if (!hasTerrain()) {
        RUNNEL_LOG_DEBUG("WaterCoordinator", "No terrain loaded, elevation not sent");
        return false;
    }

    GridDimensions dims = calcGridDimensions(m_terrain.bounds, m_resolutionCm,
                                             m_config.minGridSize, m_config.maxGridSize);
    std::vector<f32> resampled = resampleGrid(m_terrain.elevation, m_terrain.width, m_terrain.height,
                                              dims.width, dims.height);
    if (resampled.empty()) {
        return false;
    }

    f32 cellSize = resolutionToCellSize(m_resolutionCm);
    m_gridDims = dims;

    RUNNEL_LOG_INFO("WaterCoordinator", "Water simulation: %ux%u cells at %.2f m/cell",
        dims.width, dims.height, static_cast<f64>(cellSize));

    InitRequest init;
    init.elevation = std::move(resampled);
    init.width = dims.width;
    init.height = dims.height;
    init.cellSize = cellSize;
    init.generation = ++m_terrainGeneration;
    post(std::move(init));
    return true;
}

// =============================================================================
// Simulation Control
// =============================================================================

void WaterCoordinator::start() {
    if (!initialize()) {
        return;
    }
    if (!m_workerReady) {
        sendElevationData();
    }
    post(StartRequest{});
    m_running = true;
}

void WaterCoordinator::stop() {
    if (m_worker) {
        post(StopRequest{});
        if (m_raining) {
            post(StopRainRequest{});
        }
    }
    m_running = false;
    m_raining = false;
}

void WaterCoordinator::startRain() {
    if (!initialize()) {
        return;
    }
    if (!m_workerReady) {
        sendElevationData();
    }
    sendParams();
    post(StartRainRequest{});
    post(StartRequest{});
    m_running = true;
    m_raining = true;
}

void WaterCoordinator::stopRain() {
    if (m_worker) {
        post(StopRainRequest{});
    }
    m_raining = false;
}

void WaterCoordinator::reset() {
    if (m_worker) {
        post(ResetRequest{});
    }
}

// =============================================================================
// Parameters
// =============================================================================

void WaterCoordinator::setRainRate(f64 mmPerHour) {
    m_rainRateMmHr = Physics::sanitizeRate(mmPerHour);
    sendParams();
}

void WaterCoordinator::setEvaporationRate(f64 mmPerHour) {
    m_evaporationMmHr = Physics::sanitizeRate(mmPerHour);
    sendParams();
}

void WaterCoordinator::setInfiltrationRate(f64 mmPerHour) {
    m_infiltrationMmHr = Physics::sanitizeRate(mmPerHour);
    sendParams();
}

void WaterCoordinator::setFlowRate(f32 rate) {
    m_flowRate = Physics::clampFlowRateSetting(rate);
    sendParams();
}

void WaterCoordinator::sendParams() {
    if (!m_worker) {
        return;
    }

    const f64 stepMs = static_cast<f64>(m_config.stepIntervalMs);

    SetParamsRequest params;
    params.rainRate = static_cast<f32>(Physics::mmPerHourToMPerStep(m_rainRateMmHr, stepMs));
    params.evaporation = static_cast<f32>(Physics::mmPerHourToMPerStep(m_evaporationMmHr, stepMs));
    params.infiltration = static_cast<f32>(Physics::mmPerHourToMPerStep(m_infiltrationMmHr, stepMs));
    params.flowRate = m_flowRate;
    post(std::move(params));
}

void WaterCoordinator::post(WorkerRequest&& request) {
    if (!m_worker) {
        return;
    }
    if (!m_worker->post(std::move(request))) {
        RUNNEL_LOG_WARN("WaterCoordinator", "Worker rejected request");
    }
}

// =============================================================================
// Events
// =============================================================================

usize WaterCoordinator::update() {
    std::vector<WorkerEvent> pending;
    m_events.popAll(pending);

    for (auto& event : pending) {
        handleEvent(std::move(event));
    }
    return pending.size();
}

void WaterCoordinator::handleEvent(WorkerEvent&& event) {
    std::visit(Overloaded{
        [](LoadedEvent&) {
            RUNNEL_LOG_DEBUG("WaterCoordinator", "Worker loaded");
        },
        [this](ReadyEvent& ready) {
            // Superseded by a later init still in the worker's queue
            if (ready.generation != m_terrainGeneration) {
                RUNNEL_LOG_DEBUG("WaterCoordinator", "Ignoring ready for terrain generation %llu",
                    static_cast<unsigned long long>(ready.generation));
                return;
            }
            RUNNEL_LOG_INFO("WaterCoordinator", "Worker ready (%ux%u)", ready.width, ready.height);
            m_workerReady = true;
            sendParams();
        },
        [this](WaterUpdateEvent& update) {
            // Produced for a terrain that has since been replaced
            if (!m_workerReady || update.generation != m_terrainGeneration ||
                GridDimensions{update.width, update.height} != m_gridDims ||
                update.grid.size() != m_gridDims.cellCount()) {
                RUNNEL_LOG_DEBUG("WaterCoordinator", "Discarding stale %ux%u water update",
                    update.width, update.height);
                return;
            }
            m_waterGrid = std::move(update.grid);
            m_lastUpdateStep = update.step;
            m_lastUpdateTime = Clock::now();
            m_updateCount++;
        },
    }, event);
}

// =============================================================================
// State Queries
// =============================================================================

bool WaterCoordinator::getWaterBounds(f32& outMin, f32& outMax) const {
    bool found = false;
    f32 minWater = 0.0f;
    f32 maxWater = 0.0f;

    for (f32 w : m_waterGrid) {
        if (w > 0.0f) {
            minWater = found ? std::min(minWater, w) : w;
            found = true;
        }
        maxWater = std::max(maxWater, w);
    }

    if (!found) {
        return false;
    }
    outMin = minWater;
    outMax = maxWater;
    return true;
}

} // namespace Runnel
