// =============================================================================
// Runnel - Simulation Grid Sizing & Resampling
// =============================================================================
// Chooses the simulation resolution for a terrain and resamples elevation
// fields onto it with bilinear interpolation.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Terrain.h"
#include <vector>

namespace Runnel {

// =============================================================================
// Constants
// =============================================================================

constexpr u32 kMinGridSize = 10;
constexpr u32 kMaxGridSize = 512;
constexpr f32 kDefaultResolutionCm = 50.0f;

// =============================================================================
// Grid Dimensions
// =============================================================================

struct GridDimensions {
    u32 width = 0;
    u32 height = 0;

    usize cellCount() const { return static_cast<usize>(width) * height; }
    bool isEmpty() const { return width == 0 || height == 0; }

    bool operator==(const GridDimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const GridDimensions& other) const { return !(*this == other); }
};

// Cells per axis = extent / resolution, clamped to [minSize, maxSize]
GridDimensions calcGridDimensions(const TerrainBounds& bounds, f32 resolutionCm,
                                  u32 minSize = kMinGridSize,
                                  u32 maxSize = kMaxGridSize);

f32 resolutionToCellSize(f32 resolutionCm);

// =============================================================================
// Sampling
// =============================================================================

// Samples at fractional grid coordinates. Coordinates outside the grid are
// clamped; the far neighbour is clamped to the last row/column.
f32 bilinearSample(const f32* data, u32 width, u32 height, f32 x, f32 y);

// Returns an exact copy when the dimensions match. Corners of the source map
// onto corners of the destination. Returns an empty vector on bad input.
std::vector<f32> resampleGrid(const std::vector<f32>& src, u32 srcWidth, u32 srcHeight,
                              u32 dstWidth, u32 dstHeight);

} // namespace Runnel
