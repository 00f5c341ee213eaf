// =============================================================================
// Runnel - Water Physics
// =============================================================================
// Unit conversion between user-facing SI rates (mm/hour) and per-step
// depths, plus the slope-dependent flow rate. Flow speed scales with
// sqrt(slope) in the spirit of Manning's equation, applied as a single
// multiplicative correction on the base rate.
// =============================================================================

#pragma once

#include "core/Types.h"

namespace Runnel::Physics {

// =============================================================================
// Constants
// =============================================================================

constexpr u32 kSimulationIntervalMs = 50;
constexpr u32 kStepsPerSecond = 1000 / kSimulationIntervalMs;

constexpr f32 kBaseFlowRate = 0.25f;       // Fraction of water leaving a cell per step on flat ground
constexpr f32 kMaxFlowRate = 0.95f;        // Never drain a cell completely in one step
constexpr f32 kMinFlowThreshold = 1.0e-4f; // Meters; smaller depths/differences do not move

// User-adjustable flow rate range
constexpr f32 kMinFlowRateSetting = 0.01f;
constexpr f32 kMaxFlowRateSetting = 0.5f;

constexpr f64 kMillimetersPerMeter = 1000.0;
constexpr f64 kMillisecondsPerHour = 3.6e6;

// =============================================================================
// Unit Conversion
// =============================================================================

f64 mmPerHourToMPerStep(f64 mmPerHour, f64 stepMs = kSimulationIntervalMs);
f64 mPerStepToMmPerHour(f64 mPerStep, f64 stepMs = kSimulationIntervalMs);

// =============================================================================
// Slope & Flow Rate
// =============================================================================

// Rise over run. cellSizeM must be positive.
f32 calcSlope(f32 heightDiff, f32 cellSizeM);

// Negative slopes are treated as flat.
f32 slopeToFlowRate(f32 slope, f32 baseRate = kBaseFlowRate);

f32 flowRateForSlope(f32 heightDiff, f32 cellSizeM, f32 baseRate = kBaseFlowRate);

// Clamps to >= 0; NaN and infinities become 0
f32 sanitizeRate(f64 rate);

f32 clampFlowRateSetting(f32 rate);

} // namespace Runnel::Physics
