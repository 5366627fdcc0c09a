#include "AudioEncoder.hpp"
#include <cstring>
#include <libavcodec/version.h>
#include "Timestamps.hpp"
#include "core/Logger.hpp"

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace mw {

namespace {

AVSampleFormat pickSampleFormat(const AVCodec* codec) {
    if (!codec->sample_fmts)
        return AV_SAMPLE_FMT_FLT;
    for (const AVSampleFormat* fmt = codec->sample_fmts;
         *fmt != AV_SAMPLE_FMT_NONE;
         ++fmt) {
        if (*fmt == AV_SAMPLE_FMT_FLT)
            return AV_SAMPLE_FMT_FLT;
    }
    return codec->sample_fmts[0];
}

} // namespace

AudioEncoder::AudioEncoder() = default;

AudioEncoder::~AudioEncoder() = default;

Result<void> AudioEncoder::init(const AudioEncoderSettings& settings,
                                bool globalHeader) {
    settings_ = settings;
    framesSent_ = 0;
    finished_ = false;

    if (settings.channels == 0 || settings.channels > 8) {
        return Result<void>::err("Unsupported channel count for Opus: " +
                                         std::to_string(settings.channels),
                                 ErrorCode::Format);
    }

    const AVCodec* codec =
            avcodec_find_encoder_by_name(settings.codecName().c_str());
    if (!codec)
        codec = avcodec_find_encoder(AV_CODEC_ID_OPUS);
    if (!codec) {
        return Result<void>::err("Opus codec not found", ErrorCode::Codec);
    }

    codecCtx_.reset(avcodec_alloc_context3(codec));
    if (!codecCtx_) {
        return Result<void>::err("Failed to allocate audio codec context",
                                 ErrorCode::Codec);
    }

    codecCtx_->sample_rate = static_cast<int>(settings.sampleRate);
    codecCtx_->bit_rate = static_cast<i64>(settings.bitrate) * 1000;
    codecCtx_->sample_fmt = pickSampleFormat(codec);
    codecCtx_->time_base = AVRational{1, static_cast<int>(settings.sampleRate)};
    av_channel_layout_default(&codecCtx_->ch_layout,
                              static_cast<int>(settings.channels));

    if (codec->capabilities & AV_CODEC_CAP_EXPERIMENTAL) {
        codecCtx_->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    }
    if (globalHeader) {
        codecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    switch (settings.quality) {
    case Quality::Realtime:
        codecCtx_->compression_level = 0;
        av_dict_set(&opts, "application", "lowdelay", 0);
        break;
    case Quality::Good:
        codecCtx_->compression_level = 5;
        av_dict_set(&opts, "application", "audio", 0);
        break;
    case Quality::Best:
        codecCtx_->compression_level = 10;
        av_dict_set(&opts, "application", "audio", 0);
        break;
    }
    av_dict_set(&opts, "vbr", "on", 0);

    int ret = avcodec_open2(codecCtx_.get(), codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return Result<void>::err(
                "Failed to open Opus encoder: " + ffmpegError(ret),
                ErrorCode::Codec);
    }

    // Opus at another rate scales its 20 ms frame accordingly.
    frameSize_ = codecCtx_->frame_size > 0
                         ? static_cast<u32>(codecCtx_->frame_size)
                         : kOpusFrameSize * settings.sampleRate /
                                   AudioEncoderSettings::kSampleRate;

    frame_.reset(av_frame_alloc());
    if (!frame_) {
        return Result<void>::err("Failed to allocate audio frame",
                                 ErrorCode::Codec);
    }
    frame_->format = codecCtx_->sample_fmt;
    av_channel_layout_copy(&frame_->ch_layout, &codecCtx_->ch_layout);
    frame_->sample_rate = codecCtx_->sample_rate;
    frame_->nb_samples = static_cast<int>(frameSize_);
    ret = av_frame_get_buffer(frame_.get(), 0);
    if (ret < 0) {
        return Result<void>::err(
                "Failed to allocate audio frame buffers: " + ffmpegError(ret),
                ErrorCode::Codec);
    }

    if (auto result = initResampler(); !result) {
        return result;
    }

    LOG_DEBUG("Audio encoder {} opened: {} Hz, {} ch, frame {} samples, {}",
              codec->name,
              settings.sampleRate,
              settings.channels,
              frameSize_,
              av_get_sample_fmt_name(codecCtx_->sample_fmt));
    return Result<void>::ok();
}

Result<void> AudioEncoder::initResampler() {
    if (codecCtx_->sample_fmt == AV_SAMPLE_FMT_FLT)
        return Result<void>::ok();

    SwrContext* s = nullptr;
    int ret = swr_alloc_set_opts2(&s,
                                  &codecCtx_->ch_layout,
                                  codecCtx_->sample_fmt,
                                  codecCtx_->sample_rate,
                                  &codecCtx_->ch_layout,
                                  AV_SAMPLE_FMT_FLT,
                                  codecCtx_->sample_rate,
                                  0,
                                  nullptr);
    swrCtx_.reset(s);
    if (ret < 0 || !swrCtx_) {
        return Result<void>::err(
                "Failed to allocate audio resampler: " + ffmpegError(ret),
                ErrorCode::Format);
    }
    ret = swr_init(swrCtx_.get());
    if (ret < 0) {
        return Result<void>::err(
                "Failed to init audio resampler: " + ffmpegError(ret),
                ErrorCode::Format);
    }
    return Result<void>::ok();
}

Result<void> AudioEncoder::send(std::span<const f32> interleaved) {
    if (!codecCtx_ || finished_) {
        return Result<void>::err("Audio encoder is not accepting frames",
                                 ErrorCode::State);
    }

    usize expected = static_cast<usize>(frameSize_) * settings_.channels;
    if (interleaved.size() != expected) {
        return Result<void>::err(
                "EncodeError: audio frame size mismatch, expected " +
                        std::to_string(frameSize_) +
                        " samples per channel, got " +
                        std::to_string(interleaved.size() /
                                       settings_.channels),
                ErrorCode::Codec);
    }

    int ret = av_frame_make_writable(frame_.get());
    if (ret < 0) {
        return Result<void>::err(
                "Audio frame not writable: " + ffmpegError(ret),
                ErrorCode::Codec);
    }

    if (swrCtx_) {
        const u8* srcData[1] = {
                reinterpret_cast<const u8*>(interleaved.data())};
        ret = swr_convert(swrCtx_.get(),
                          frame_->data,
                          static_cast<int>(frameSize_),
                          srcData,
                          static_cast<int>(frameSize_));
        if (ret < 0) {
            return Result<void>::err(
                    "Audio resample error: " + ffmpegError(ret),
                    ErrorCode::Codec);
        }
    } else {
        std::memcpy(frame_->data[0],
                    interleaved.data(),
                    interleaved.size() * sizeof(f32));
    }

    frame_->pts = audioFramePts(framesSent_, frameSize_);

    ret = avcodec_send_frame(codecCtx_.get(), frame_.get());
    if (ret < 0) {
        return Result<void>::err("Failed to send audio frame: " +
                                         ffmpegError(ret),
                                 ErrorCode::Codec);
    }
    ++framesSent_;
    return Result<void>::ok();
}

Result<PacketList> AudioEncoder::receivePackets() {
    PacketList packets;
    if (!codecCtx_)
        return Result<PacketList>::ok(std::move(packets));

    int ret = drainPackets(codecCtx_.get(), packets);
    if (ret < 0) {
        return Result<PacketList>::err(
                "Failed to receive audio packet: " + ffmpegError(ret),
                ErrorCode::Codec);
    }
    return Result<PacketList>::ok(std::move(packets));
}

Result<PacketList> AudioEncoder::finish() {
    if (!codecCtx_ || finished_)
        return Result<PacketList>::ok(PacketList{});

    finished_ = true;
    int ret = avcodec_send_frame(codecCtx_.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return Result<PacketList>::err(
                "Failed to send EOF to audio encoder: " + ffmpegError(ret),
                ErrorCode::Codec);
    }
    return receivePackets();
}

AVRational AudioEncoder::timeBase() const {
    if (codecCtx_)
        return codecCtx_->time_base;
    return AVRational{1, static_cast<int>(settings_.sampleRate)};
}

} // namespace mw

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic pop
#endif
