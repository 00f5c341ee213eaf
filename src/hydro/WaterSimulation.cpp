// =============================================================================
// Runnel - Water Simulation Implementation
// =============================================================================

#include "WaterSimulation.h"
#include "core/Assert.h"
#include "core/Log.h"
#include "core/Profiler.h"
#include <algorithm>
#include <cmath>

namespace Runnel {

bool WaterSimulation::initialize(std::vector<f32> elevation, u32 width, u32 height, f32 cellSizeM) {
    usize cellCount = static_cast<usize>(width) * height;

    if (width == 0 || height == 0) {
        RUNNEL_LOG_WARN("WaterSim", "Rejected init with empty grid %ux%u", width, height);
        return false;
    }
    if (elevation.size() != cellCount) {
        RUNNEL_LOG_WARN("WaterSim", "Rejected init: elevation has %zu values, expected %zu (%ux%u)",
            elevation.size(), cellCount, width, height);
        return false;
    }
    if (!(cellSizeM > 0.0f) || !std::isfinite(cellSizeM)) {
        RUNNEL_LOG_WARN("WaterSim", "Rejected init with invalid cell size %.4f m",
            static_cast<f64>(cellSizeM));
        return false;
    }

    m_elevation = std::move(elevation);
    m_water.assign(cellCount, 0.0f);
    m_flow.assign(cellCount, 0.0f);
    m_width = width;
    m_height = height;
    m_cellSize = cellSizeM;
    m_stepCount = 0;

    usize noData = static_cast<usize>(std::count_if(m_elevation.begin(), m_elevation.end(),
        [](f32 e) { return std::isnan(e); }));

    RUNNEL_LOG_INFO("WaterSim", "Initialized %ux%u cells at %.2f m/cell (%zu without elevation)",
        width, height, static_cast<f64>(cellSizeM), noData);
    return true;
}

void WaterSimulation::release() {
    m_elevation.clear();
    m_elevation.shrink_to_fit();
    m_water.clear();
    m_water.shrink_to_fit();
    m_flow.clear();
    m_flow.shrink_to_fit();
    m_width = 0;
    m_height = 0;
    m_stepCount = 0;
}

bool WaterSimulation::isInitialized() const {
    usize cellCount = static_cast<usize>(m_width) * m_height;
    return cellCount > 0 &&
           m_elevation.size() == cellCount &&
           m_water.size() == cellCount &&
           m_flow.size() == cellCount;
}

void WaterSimulation::setParams(const SimulationParams& params) {
    m_params.rainRate = Physics::sanitizeRate(params.rainRate);
    m_params.evaporation = Physics::sanitizeRate(params.evaporation);
    m_params.infiltration = Physics::sanitizeRate(params.infiltration);
    m_params.flowRate = Physics::clampFlowRateSetting(params.flowRate);

    if (params.minFlowThreshold > 0.0f && std::isfinite(params.minFlowThreshold)) {
        m_params.minFlowThreshold = params.minFlowThreshold;
    } else {
        m_params.minFlowThreshold = Physics::kMinFlowThreshold;
    }
}

void WaterSimulation::reset() {
    std::fill(m_water.begin(), m_water.end(), 0.0f);
    std::fill(m_flow.begin(), m_flow.end(), 0.0f);
}

void WaterSimulation::step() {
    if (!isInitialized()) {
        return;
    }

    RUNNEL_PROFILE_SCOPE_NAMED("WaterSimulation::step");

    if (m_mode.raining) {
        addRain();
    }
    simulateFlow();
    removeUniform(m_params.evaporation);
    removeUniform(m_params.infiltration);

    m_stepCount++;
}

void WaterSimulation::addRain() {
    const f32 rain = m_params.rainRate;
    if (rain <= 0.0f) {
        return;
    }
    for (f32& w : m_water) {
        w += rain;
    }
}

void WaterSimulation::simulateFlow() {
    RUNNEL_PROFILE_SCOPE_NAMED("WaterSimulation::flow");

    const u32 W = m_width;
    const u32 H = m_height;
    const f32 minFlow = m_params.minFlowThreshold;
    const f32 baseFlow = m_params.flowRate;

    const f32* elevation = m_elevation.data();
    const f32* water = m_water.data();
    f32* flow = m_flow.data();

    std::fill(m_flow.begin(), m_flow.end(), 0.0f);

    for (u32 y = 0; y < H; ++y) {
        const usize row = static_cast<usize>(y) * W;
        const bool atTop = y == 0;
        const bool atBottom = y == H - 1;

        for (u32 x = 0; x < W; ++x) {
            const usize i = row + x;
            const f32 depth = water[i];
            if (!(depth > minFlow)) continue;

            const f32 ground = elevation[i];
            if (std::isnan(ground)) continue;

            const bool atLeft = x == 0;
            const bool atRight = x == W - 1;
            const bool isEdge = atTop || atBottom || atLeft || atRight;

            const f32 myHeight = ground + depth;
            f32 totalDiff = 0.0f;
            f32 maxDiff = 0.0f;

            usize targets[4];
            f32 diffs[4];
            u32 count = 0;

            auto consider = [&](bool exists, usize j) {
                if (!exists || std::isnan(elevation[j])) return;
                f32 diff = myHeight - (elevation[j] + water[j]);
                if (diff > minFlow) {
                    targets[count] = j;
                    diffs[count] = diff;
                    count++;
                    totalDiff += diff;
                    if (diff > maxDiff) maxDiff = diff;
                }
            };

            consider(!atLeft, i - 1);
            consider(!atRight, i + 1);
            consider(!atTop, i - W);
            consider(!atBottom, i + W);

            // Off-grid counts as a neighbour at height 0
            if (isEdge && myHeight > 0.0f) {
                totalDiff += myHeight;
                if (myHeight > maxDiff) maxDiff = myHeight;
            }

            if (totalDiff > 0.0f) {
                const f32 rate = Physics::flowRateForSlope(maxDiff, m_cellSize, baseFlow);
                const f32 outflow = depth * rate;

                for (u32 n = 0; n < count; ++n) {
                    flow[targets[n]] += outflow * diffs[n] / totalDiff;
                }
                flow[i] -= outflow;
            }
        }
    }

    const usize cellCount = m_water.size();
    for (usize i = 0; i < cellCount; ++i) {
        m_water[i] = std::max(0.0f, m_water[i] + flow[i]);
    }
}

void WaterSimulation::removeUniform(f32 amount) {
    if (amount <= 0.0f) {
        return;
    }
    for (f32& w : m_water) {
        if (w > 0.0f) {
            w = std::max(0.0f, w - amount);
        }
    }
}

f32 WaterSimulation::getWaterDepth(u32 x, u32 y) const {
    RUNNEL_ASSERT_MSG(x < m_width && y < m_height, "Water cell out of range");
    return m_water[index(x, y)];
}

void WaterSimulation::setWaterDepth(u32 x, u32 y, f32 depth) {
    if (x >= m_width || y >= m_height) {
        RUNNEL_LOG_WARN("WaterSim", "Ignoring water at (%u, %u) outside %ux%u grid",
            x, y, m_width, m_height);
        return;
    }
    m_water[index(x, y)] = Physics::sanitizeRate(depth);
}

f64 WaterSimulation::totalWaterDepth() const {
    f64 total = 0.0;
    for (f32 w : m_water) {
        total += w;
    }
    return total;
}

f64 WaterSimulation::totalWaterVolume() const {
    const f64 cellArea = static_cast<f64>(m_cellSize) * m_cellSize;
    return totalWaterDepth() * cellArea;
}

usize WaterSimulation::wetCellCount(f32 minDepth) const {
    return static_cast<usize>(std::count_if(m_water.begin(), m_water.end(),
        [minDepth](f32 w) { return w > minDepth; }));
}

} // namespace Runnel
