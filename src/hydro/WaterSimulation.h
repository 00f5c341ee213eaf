// =============================================================================
// Runnel - Water Simulation State
// =============================================================================
// Explicit shallow-water cellular automaton over a height field.
//
// Each step: rain -> flow -> evaporation -> infiltration. Flow moves a
// fraction of each cell's water to lower 4-neighbours in proportion to the
// height differences. Cells on the grid boundary also drain towards an
// implicit neighbour at height 0, so water leaves the map at the edges.
//
// All reads during the flow pass see the pre-step water field; transfers
// are buffered in the flow accumulator and merged afterwards, which makes
// the result independent of cell processing order.
//
// Not thread-safe. Owned by exactly one thread (see SimulationWorker).
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Physics.h"
#include "HeightGrid.h"
#include <vector>

namespace Runnel {

// Per-step quantities, in meters per step (flowRate is a fraction)
struct SimulationParams {
    f32 rainRate = 0.0f;
    f32 evaporation = 0.0f;
    f32 infiltration = 0.0f;
    f32 flowRate = Physics::kBaseFlowRate;
    f32 minFlowThreshold = Physics::kMinFlowThreshold;
};

struct SimulationMode {
    bool running = false;
    bool raining = false;
};

class WaterSimulation : public NonCopyable {
public:
    WaterSimulation() = default;
    ~WaterSimulation() = default;

    // Takes ownership of the elevation buffer and allocates zeroed water and
    // flow buffers. Replaces any previous terrain entirely. Returns false and
    // keeps the previous state if the input is inconsistent.
    bool initialize(std::vector<f32> elevation, u32 width, u32 height, f32 cellSizeM);
    void release();

    bool isInitialized() const;

    // Out-of-range values are clamped, never rejected
    void setParams(const SimulationParams& params);
    const SimulationParams& getParams() const { return m_params; }

    void setRunning(bool running) { m_mode.running = running; }
    void setRaining(bool raining) { m_mode.raining = raining; }
    bool isRunning() const { return m_mode.running; }
    bool isRaining() const { return m_mode.raining; }
    const SimulationMode& getMode() const { return m_mode; }

    // Zero-fills the water field. Mode and parameters are untouched.
    void reset();

    // No-op when uninitialized
    void step();

    // Accessors
    u32 getWidth() const { return m_width; }
    u32 getHeight() const { return m_height; }
    GridDimensions getDimensions() const { return GridDimensions{m_width, m_height}; }
    f32 getCellSize() const { return m_cellSize; }
    u64 getStepCount() const { return m_stepCount; }

    const std::vector<f32>& getElevation() const { return m_elevation; }
    const std::vector<f32>& getWater() const { return m_water; }

    f32 getWaterDepth(u32 x, u32 y) const;
    void setWaterDepth(u32 x, u32 y, f32 depth);

    // Detached copy for handing to another thread
    std::vector<f32> snapshotWater() const { return m_water; }

    // Diagnostics
    f64 totalWaterDepth() const;
    f64 totalWaterVolume() const;   // m^3
    usize wetCellCount(f32 minDepth = Physics::kMinFlowThreshold) const;

private:
    void addRain();
    void simulateFlow();
    void removeUniform(f32 amount);

    usize index(u32 x, u32 y) const { return static_cast<usize>(y) * m_width + x; }

    std::vector<f32> m_elevation;
    std::vector<f32> m_water;
    std::vector<f32> m_flow;

    u32 m_width = 0;
    u32 m_height = 0;
    f32 m_cellSize = 0.5f;

    SimulationParams m_params;
    SimulationMode m_mode;
    u64 m_stepCount = 0;
};

} // namespace Runnel
