/**
 * @file EncoderSettings.hpp
 * @brief Everything an encoder needs to know, captured at session start.
 */

#pragma once
#include <string>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace mw {

struct VideoEncoderSettings {
    VideoCodec codec{VideoCodec::VP9};
    Quality quality{Quality::Realtime};
    u32 threadCount{0};
    u32 width{0};
    u32 height{0};
    u32 fps{30};
    // Tag the stream full range (0..255) instead of video range.
    bool fullRange{false};

    // FFmpeg encoder name ("libvpx-vp9", ...)
    std::string codecName() const;
};

struct AudioEncoderSettings {
    static constexpr u32 kSampleRate = 48000;
    static constexpr u32 kStereo = 2;

    Quality quality{Quality::Realtime};
    u32 sampleRate{kSampleRate};
    u32 channels{kStereo};
    u32 bitrate{128}; // kbit/s

    std::string codecName() const {
        return "libopus";
    }
};

struct EncoderSettings {
    fs::path outputPath;
    VideoEncoderSettings video;
    AudioEncoderSettings audio;
    bool alphaChannel{false};
    bool enableAudio{true};
    u64 maxFileSize{0}; // bytes of packet payload, 0 = no limit

    static EncoderSettings fromConfig(const RecorderConfig& config);
    static EncoderSettings fromConfig();

    Result<void> validate() const;
};

} // namespace mw
