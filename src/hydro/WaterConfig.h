// =============================================================================
// Runnel - Water Simulation Configuration
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Physics.h"
#include "HeightGrid.h"

namespace Runnel {

struct WaterSimConfig {
    // Tick period of the worker loop. Also the step length used when
    // converting mm/hour rates, so both always agree.
    u32 stepIntervalMs = Physics::kSimulationIntervalMs;

    // Terrain resolution per simulation cell
    f32 resolutionCm = kDefaultResolutionCm;
    u32 minGridSize = kMinGridSize;
    u32 maxGridSize = kMaxGridSize;

    // Initial rates (mm/hour)
    f64 rainRateMmHr = 10.0;
    f64 evaporationMmHr = 5.0;
    f64 infiltrationMmHr = 0.0;

    f32 flowRate = Physics::kBaseFlowRate;
    f32 minFlowThreshold = Physics::kMinFlowThreshold;
};

} // namespace Runnel
