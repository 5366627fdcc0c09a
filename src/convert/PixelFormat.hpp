/**
 * @file PixelFormat.hpp
 * @brief Pixel formats and the plane layout of each planar target.
 */

#pragma once
#include <vector>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace mw {

enum class PixelFormat {
    Rgba8,    // packed source format
    Yuv420p,  // Y, Cb, Cr; chroma halved on both axes
    Yuva420p, // Yuv420p plus a full size alpha plane
    Yuv444p,  // no conversion pipeline exists for these two
    Nv12
};

const char* pixelFormatName(PixelFormat format);

struct PlaneSpec {
    const char* name;
    u32 divisorX{1};
    u32 divisorY{1};
};

struct PlaneLayout {
    std::vector<PlaneSpec> planes; // alpha, when present, is always last
    bool hasAlpha{false};

    usize colorPlaneCount() const {
        return hasAlpha ? planes.size() - 1 : planes.size();
    }
};

// Layout of a planar target format, or a Format error when the format has
// no plane layout the converter can produce.
Result<PlaneLayout> planeLayout(PixelFormat format);

inline u32 subsampledExtent(u32 extent, u32 divisor) {
    return (extent + divisor - 1) / divisor;
}

} // namespace mw
