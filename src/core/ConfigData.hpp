/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values, kept apart from the
 * parsing and loading logic so encoder code can include them cheaply.
 */

#pragma once
#include <string>
#include "util/Types.hpp"

namespace mw {

enum class Quality { Realtime, Good, Best };

enum class VideoCodec { VP9, H264, AV1 };

// Settings a recording reads once, when the session begins.
struct RecorderConfig {
    u32 threadCount{0}; // 0 = let the codec decide
    Quality quality{Quality::Realtime};
    bool alphaChannel{false};
    bool enableAudio{true};
    VideoCodec codec{VideoCodec::VP9};
    u32 audioBitrate{128}; // kbit/s
    u32 maxFileSizeMb{0};  // 0 = no limit
};

const char* qualityName(Quality quality);
const char* videoCodecName(VideoCodec codec);

} // namespace mw
