// =============================================================================
// Runnel - Runnel.h
// =============================================================================
// Main include header for Runnel.
// Include this header to get access to all Runnel functionality.
// =============================================================================

#pragma once

// Version information
#define RUNNEL_VERSION_MAJOR 0
#define RUNNEL_VERSION_MINOR 1
#define RUNNEL_VERSION_PATCH 0
#define RUNNEL_VERSION_STRING "0.1.0"

// =============================================================================
// Core Systems
// =============================================================================

#include "core/Types.h"
#include "core/Log.h"
#include "core/Profiler.h"

// =============================================================================
// Water Simulation
// =============================================================================

#include "hydro/Physics.h"
#include "hydro/HeightGrid.h"
#include "hydro/WaterConfig.h"
#include "hydro/WaterSimulation.h"
#include "hydro/WaterCoordinator.h"
