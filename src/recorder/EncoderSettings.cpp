#include "EncoderSettings.hpp"
#include "core/Config.hpp"

namespace mw {

std::string VideoEncoderSettings::codecName() const {
    switch (codec) {
    case VideoCodec::H264:
        return "libx264";
    case VideoCodec::AV1:
        return "libaom-av1";
    case VideoCodec::VP9:
        break;
    }
    return "libvpx-vp9";
}

EncoderSettings EncoderSettings::fromConfig(const RecorderConfig& config) {
    EncoderSettings settings;
    settings.video.codec = config.codec;
    settings.video.quality = config.quality;
    settings.video.threadCount = config.threadCount;
    settings.audio.quality = config.quality;
    settings.audio.bitrate = config.audioBitrate;
    settings.alphaChannel = config.alphaChannel;
    settings.enableAudio = config.enableAudio;
    settings.maxFileSize = static_cast<u64>(config.maxFileSizeMb) * 1024 * 1024;
    return settings;
}

EncoderSettings EncoderSettings::fromConfig() {
    return fromConfig(CONFIG.recorder());
}

Result<void> EncoderSettings::validate() const {
    if (outputPath.empty())
        return Result<void>::err("No output path", ErrorCode::Io);
    if (video.fps == 0)
        return Result<void>::err("Frame rate must be positive",
                                 ErrorCode::Format);
    if (video.width == 0 || video.height == 0)
        return Result<void>::err("Video size must be positive",
                                 ErrorCode::Format);
    if (enableAudio && (audio.channels == 0 || audio.sampleRate == 0))
        return Result<void>::err("Invalid audio layout", ErrorCode::Format);
    return Result<void>::ok();
}

} // namespace mw
