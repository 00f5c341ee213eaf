// =============================================================================
// Runnel - Simulation Grid Sizing & Resampling Implementation
// =============================================================================

#include "HeightGrid.h"
#include "core/Assert.h"
#include "core/Log.h"
#include "core/Profiler.h"
#include <algorithm>
#include <cmath>

namespace Runnel {

namespace {

u32 cellsForExtent(f32 extentCm, f32 resolutionCm, u32 minSize, u32 maxSize) {
    f64 cells = std::round(static_cast<f64>(extentCm) / static_cast<f64>(resolutionCm));
    if (!std::isfinite(cells)) {
        cells = static_cast<f64>(minSize);
    }
    cells = std::clamp(cells, static_cast<f64>(minSize), static_cast<f64>(maxSize));
    return static_cast<u32>(cells);
}

// Skips the far sample entirely at t == 0 so a no-data neighbour
// cannot leak into an exact grid-point lookup.
f32 lerpSample(f32 a, f32 b, f32 t) {
    if (t <= 0.0f) {
        return a;
    }
    return a * (1.0f - t) + b * t;
}

} // namespace

GridDimensions calcGridDimensions(const TerrainBounds& bounds, f32 resolutionCm,
                                  u32 minSize, u32 maxSize) {
    if (maxSize < minSize) {
        std::swap(minSize, maxSize);
    }

    if (!(resolutionCm > 0.0f) || !std::isfinite(resolutionCm)) {
        RUNNEL_LOG_WARN("Grid", "Invalid resolution %.3f cm, using minimum grid %ux%u",
            static_cast<f64>(resolutionCm), minSize, minSize);
        return GridDimensions{minSize, minSize};
    }

    GridDimensions dims;
    dims.width = cellsForExtent(bounds.width(), resolutionCm, minSize, maxSize);
    dims.height = cellsForExtent(bounds.height(), resolutionCm, minSize, maxSize);
    return dims;
}

f32 resolutionToCellSize(f32 resolutionCm) {
    return resolutionCm / 100.0f;
}

f32 bilinearSample(const f32* data, u32 width, u32 height, f32 x, f32 y) {
    RUNNEL_ASSERT_MSG(data != nullptr && width > 0 && height > 0, "Sampling an empty grid");

    x = std::clamp(x, 0.0f, static_cast<f32>(width - 1));
    y = std::clamp(y, 0.0f, static_cast<f32>(height - 1));

    u32 x0 = static_cast<u32>(x);
    u32 y0 = static_cast<u32>(y);
    u32 x1 = std::min(x0 + 1, width - 1);
    u32 y1 = std::min(y0 + 1, height - 1);

    f32 fx = x - static_cast<f32>(x0);
    f32 fy = y - static_cast<f32>(y0);

    f32 v00 = data[y0 * width + x0];
    f32 v10 = data[y0 * width + x1];
    f32 v01 = data[y1 * width + x0];
    f32 v11 = data[y1 * width + x1];

    f32 top = lerpSample(v00, v10, fx);
    if (fy <= 0.0f) {
        return top;
    }
    f32 bottom = lerpSample(v01, v11, fx);
    return lerpSample(top, bottom, fy);
}

std::vector<f32> resampleGrid(const std::vector<f32>& src, u32 srcWidth, u32 srcHeight,
                              u32 dstWidth, u32 dstHeight) {
    RUNNEL_PROFILE_SCOPE_NAMED("Grid::resample");

    if (srcWidth == 0 || srcHeight == 0 ||
        src.size() != static_cast<usize>(srcWidth) * srcHeight) {
        RUNNEL_LOG_WARN("Grid", "Cannot resample %ux%u grid from buffer of %zu values",
            srcWidth, srcHeight, src.size());
        return {};
    }

    if (srcWidth == dstWidth && srcHeight == dstHeight) {
        return src;
    }

    std::vector<f32> dst(static_cast<usize>(dstWidth) * dstHeight);

    f32 scaleX = dstWidth > 1
        ? static_cast<f32>(srcWidth - 1) / static_cast<f32>(dstWidth - 1) : 0.0f;
    f32 scaleY = dstHeight > 1
        ? static_cast<f32>(srcHeight - 1) / static_cast<f32>(dstHeight - 1) : 0.0f;

    for (u32 y = 0; y < dstHeight; ++y) {
        f32 sy = static_cast<f32>(y) * scaleY;
        for (u32 x = 0; x < dstWidth; ++x) {
            f32 sx = static_cast<f32>(x) * scaleX;
            dst[static_cast<usize>(y) * dstWidth + x] =
                bilinearSample(src.data(), srcWidth, srcHeight, sx, sy);
        }
    }

    RUNNEL_LOG_DEBUG("Grid", "Resampled %ux%u -> %ux%u", srcWidth, srcHeight, dstWidth, dstHeight);
    return dst;
}

} // namespace Runnel
