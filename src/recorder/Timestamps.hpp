/**
 * @file Timestamps.hpp
 * @brief Presentation timestamp arithmetic for the encoders.
 */

#pragma once
#include <cmath>
#include "util/Types.hpp"

namespace mw {

// Ticks per second of the video encoder time base (1 / (fps * 1000)).
inline i64 videoTicksPerSecond(u32 fps) {
    return static_cast<i64>(fps) * 1000;
}

// round(frameIndex / fps * ticksPerSecond)
inline i64 frameToPts(i64 frameIndex, i64 fps, i64 ticksPerSecond) {
    if (fps <= 0)
        return 0;
    f64 seconds = static_cast<f64>(frameIndex) / static_cast<f64>(fps);
    return std::llround(seconds * static_cast<f64>(ticksPerSecond));
}

// Sample-accurate audio PTS in a 1 / sampleRate time base.
inline i64 audioFramePts(i64 frameIndex, i64 frameSize) {
    return frameIndex * frameSize;
}

} // namespace mw
