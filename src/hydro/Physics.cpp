// =============================================================================
// Runnel - Water Physics Implementation
// =============================================================================

#include "Physics.h"
#include <algorithm>
#include <cmath>

namespace Runnel::Physics {

f64 mmPerHourToMPerStep(f64 mmPerHour, f64 stepMs) {
    return (mmPerHour / kMillimetersPerMeter) * stepMs / kMillisecondsPerHour;
}

f64 mPerStepToMmPerHour(f64 mPerStep, f64 stepMs) {
    if (stepMs <= 0.0) {
        return 0.0;
    }
    return mPerStep * kMillimetersPerMeter * kMillisecondsPerHour / stepMs;
}

f32 calcSlope(f32 heightDiff, f32 cellSizeM) {
    return heightDiff / cellSizeM;
}

f32 slopeToFlowRate(f32 slope, f32 baseRate) {
    f32 flowMult = 1.0f + std::sqrt(std::max(0.0f, slope));
    return std::min(kMaxFlowRate, baseRate * flowMult);
}

f32 flowRateForSlope(f32 heightDiff, f32 cellSizeM, f32 baseRate) {
    return slopeToFlowRate(calcSlope(heightDiff, cellSizeM), baseRate);
}

f32 sanitizeRate(f64 rate) {
    if (!std::isfinite(rate) || rate < 0.0) {
        return 0.0f;
    }
    return static_cast<f32>(rate);
}

f32 clampFlowRateSetting(f32 rate) {
    if (std::isnan(rate)) {
        return kBaseFlowRate;
    }
    return std::clamp(rate, kMinFlowRateSetting, kMaxFlowRateSetting);
}

} // namespace Runnel::Physics
