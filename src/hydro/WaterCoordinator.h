// =============================================================================
// Runnel - Water Coordinator
// =============================================================================
// Main-thread façade over the simulation worker. Owns the user-facing
// parameters (mm/hour), converts them to per-step depths, resamples the
// terrain onto the simulation grid and keeps the latest water field for
// renderers. Never blocks: requests are posted, events are drained by
// update().
//
// All methods must be called from the same thread.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "core/threading/MessageQueue.h"
#include "HeightGrid.h"
#include "Messages.h"
#include "SimulationWorker.h"
#include "Terrain.h"
#include "WaterConfig.h"
#include <chrono>
#include <memory>
#include <vector>

namespace Runnel {

class WaterCoordinator : public NonMoveable {
public:
    using Clock = std::chrono::steady_clock;

    explicit WaterCoordinator(const WaterSimConfig& config = {});
    ~WaterCoordinator();

    // Creates the worker on first call. Returns false if the simulation is
    // unavailable; a failed creation is not retried.
    bool initialize();
    void shutdown();

    bool isAvailable() const { return m_worker != nullptr; }
    bool isWorkerReady() const { return m_workerReady; }

    // =========================================================================
    // Terrain
    // =========================================================================

    // Replaces the terrain. A live worker is re-initialized with the new
    // elevation; the running/raining mode carries over.
    void setTerrain(TerrainData terrain);
    void setResolution(f32 resolutionCm);

    bool hasTerrain() const { return m_terrain.isValid(); }
    f32 getResolution() const { return m_resolutionCm; }
    f32 getCellSize() const { return resolutionToCellSize(m_resolutionCm); }

    // =========================================================================
    // Simulation Control
    // =========================================================================

    // Flow and drainage only, no rain
    void start();
    void stop();

    // Also starts the simulation if it is not running
    void startRain();

    // Rain stops, drainage continues
    void stopRain();

    // Clears all water. Safe in any state; does not stop the loop.
    void reset();

    // =========================================================================
    // Parameters
    // =========================================================================

    void setRainRate(f64 mmPerHour);
    void setEvaporationRate(f64 mmPerHour);
    void setInfiltrationRate(f64 mmPerHour);
    void setFlowRate(f32 rate);     // Clamped to [0.01, 0.5]

    f64 getRainRate() const { return m_rainRateMmHr; }
    f64 getEvaporationRate() const { return m_evaporationMmHr; }
    f64 getInfiltrationRate() const { return m_infiltrationMmHr; }
    f32 getFlowRate() const { return m_flowRate; }

    // =========================================================================
    // Events
    // =========================================================================

    // Handles pending worker events. Returns the number processed.
    usize update();

    // =========================================================================
    // State Queries
    // =========================================================================

    bool isRunning() const { return m_running; }
    bool isRaining() const { return m_raining; }

    // Latest water heights (meters); empty until the first update arrives
    const std::vector<f32>& getWaterGrid() const { return m_waterGrid; }
    GridDimensions getGridDimensions() const { return m_gridDims; }

    // Min over wet cells, max over all cells. False when there is no water.
    bool getWaterBounds(f32& outMin, f32& outMax) const;

    u64 getLastUpdateStep() const { return m_lastUpdateStep; }
    u64 getUpdateCount() const { return m_updateCount; }
    Clock::time_point getLastUpdateTime() const { return m_lastUpdateTime; }

private:
    bool sendElevationData();
    void sendParams();
    void post(WorkerRequest&& request);
    void handleEvent(WorkerEvent&& event);

    WaterSimConfig m_config;

    // Declared before the worker so it outlives the worker's sink
    MessageQueue<WorkerEvent> m_events;
    std::unique_ptr<SimulationWorker> m_worker;
    bool m_workerFailed = false;
    bool m_workerReady = false;

    TerrainData m_terrain;
    f32 m_resolutionCm;

    f64 m_rainRateMmHr;
    f64 m_evaporationMmHr;
    f64 m_infiltrationMmHr;
    f32 m_flowRate;

    bool m_running = false;
    bool m_raining = false;

    // Bumped on every init sent; events from older terrains are dropped
    u64 m_terrainGeneration = 0;

    std::vector<f32> m_waterGrid;
    GridDimensions m_gridDims;
    u64 m_lastUpdateStep = 0;
    u64 m_updateCount = 0;
    Clock::time_point m_lastUpdateTime;
};

} // namespace Runnel
