// =============================================================================
// Runnel - Terrain Input
// =============================================================================
// Elevation data as delivered by the terrain loader. The loader owns
// parsing; this is only the hand-off format.
// =============================================================================

#pragma once

#include "core/Types.h"
#include <vector>

namespace Runnel {

// Horizontal extent of the terrain in centimeters
struct TerrainBounds {
    f32 minX = 0.0f;
    f32 minY = 0.0f;
    f32 maxX = 0.0f;
    f32 maxY = 0.0f;

    f32 width() const { return maxX - minX; }
    f32 height() const { return maxY - minY; }
};

struct TerrainData {
    std::vector<f32> elevation;   // Row-major, meters, NaN = no data
    u32 width = 0;
    u32 height = 0;
    TerrainBounds bounds;

    bool isValid() const {
        return width > 0 && height > 0 &&
               elevation.size() == static_cast<usize>(width) * height;
    }
};

} // namespace Runnel
