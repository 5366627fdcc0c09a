#include "VideoEncoder.hpp"
#include "Timestamps.hpp"
#include "core/Logger.hpp"

namespace mw {

VideoEncoder::VideoEncoder() = default;

VideoEncoder::~VideoEncoder() = default;

Result<void> VideoEncoder::init(const VideoEncoderSettings& settings,
                                bool globalHeader) {
    settings_ = settings;
    framesSent_ = 0;
    finished_ = false;

    if (settings.width == 0 || settings.height == 0 || settings.fps == 0) {
        return Result<void>::err("Invalid video encoder geometry",
                                 ErrorCode::Format);
    }

    const AVCodec* codec =
            avcodec_find_encoder_by_name(settings.codecName().c_str());
    if (!codec) {
        return Result<void>::err(
                "Video codec not found: " + settings.codecName(),
                ErrorCode::Codec);
    }

    codecCtx_.reset(avcodec_alloc_context3(codec));
    if (!codecCtx_) {
        return Result<void>::err("Failed to allocate video codec context",
                                 ErrorCode::Codec);
    }

    int fps = static_cast<int>(settings.fps);
    codecCtx_->width = static_cast<int>(settings.width);
    codecCtx_->height = static_cast<int>(settings.height);
    codecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codecCtx_->color_range =
            settings.fullRange ? AVCOL_RANGE_JPEG : AVCOL_RANGE_MPEG;
    codecCtx_->time_base =
            AVRational{1, static_cast<int>(videoTicksPerSecond(settings.fps))};
    codecCtx_->framerate = AVRational{fps, 1};
    codecCtx_->gop_size = fps * 2;
    codecCtx_->max_b_frames = 0;
    codecCtx_->thread_count = static_cast<int>(settings.threadCount);

    if (globalHeader) {
        codecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    applyQuality(&opts);

    int ret = avcodec_open2(codecCtx_.get(), codec, &opts);
    av_dict_free(&opts);

    if (ret < 0) {
        return Result<void>::err(
                "Failed to open video codec " + settings.codecName() + ": " +
                        ffmpegError(ret),
                ErrorCode::Codec);
    }

    frame_.reset(av_frame_alloc());
    if (!frame_) {
        return Result<void>::err("Failed to allocate video frame",
                                 ErrorCode::Codec);
    }
    frame_->format = codecCtx_->pix_fmt;
    frame_->width = codecCtx_->width;
    frame_->height = codecCtx_->height;
    ret = av_frame_get_buffer(frame_.get(), 0);
    if (ret < 0) {
        return Result<void>::err(
                "Failed to allocate video frame buffers: " + ffmpegError(ret),
                ErrorCode::Codec);
    }

    LOG_DEBUG("Video encoder {} opened: {}x{} @ {} fps, quality {}, "
              "threads {}{}",
              settings.codecName(),
              settings.width,
              settings.height,
              settings.fps,
              qualityName(settings.quality),
              settings.threadCount,
              settings.fullRange ? ", full range" : "");
    return Result<void>::ok();
}

void VideoEncoder::applyQuality(AVDictionary** opts) const {
    switch (settings_.codec) {
    case VideoCodec::VP9: {
        const char* deadline = "realtime";
        const char* cpuUsed = "5";
        if (settings_.quality == Quality::Good) {
            deadline = "good";
            cpuUsed = "2";
        } else if (settings_.quality == Quality::Best) {
            deadline = "best";
            cpuUsed = "0";
        }
        av_dict_set(opts, "deadline", deadline, 0);
        av_dict_set(opts, "cpu-used", cpuUsed, 0);
        // One packet per frame keeps packet order equal to frame order.
        av_dict_set(opts, "lag-in-frames", "0", 0);
        av_dict_set(opts, "auto-alt-ref", "0", 0);
        av_dict_set(opts, "row-mt", "1", 0);
        break;
    }
    case VideoCodec::H264: {
        const char* preset = "ultrafast";
        if (settings_.quality == Quality::Good)
            preset = "medium";
        else if (settings_.quality == Quality::Best)
            preset = "slow";
        av_dict_set(opts, "preset", preset, 0);
        av_dict_set(opts, "tune", "zerolatency", 0);
        av_dict_set(opts, "crf", "23", 0);
        break;
    }
    case VideoCodec::AV1: {
        const char* usage =
                settings_.quality == Quality::Realtime ? "realtime" : "good";
        const char* cpuUsed = "8";
        if (settings_.quality == Quality::Good)
            cpuUsed = "5";
        else if (settings_.quality == Quality::Best)
            cpuUsed = "3";
        av_dict_set(opts, "usage", usage, 0);
        av_dict_set(opts, "cpu-used", cpuUsed, 0);
        av_dict_set(opts, "lag-in-frames", "0", 0);
        av_dict_set(opts, "row-mt", "1", 0);
        break;
    }
    }
}

Result<AVFrame*> VideoEncoder::acquireFrame() {
    if (!frame_) {
        return Result<AVFrame*>::err("Video encoder not initialized",
                                     ErrorCode::State);
    }
    int ret = av_frame_make_writable(frame_.get());
    if (ret < 0) {
        return Result<AVFrame*>::err(
                "Video frame not writable: " + ffmpegError(ret),
                ErrorCode::Codec);
    }
    return Result<AVFrame*>::ok(frame_.get());
}

Result<void> VideoEncoder::send(const AVFrame* frame) {
    if (!codecCtx_ || finished_) {
        return Result<void>::err("Video encoder is not accepting frames",
                                 ErrorCode::State);
    }
    if (!frame || frame->format != codecCtx_->pix_fmt ||
        frame->width != codecCtx_->width ||
        frame->height != codecCtx_->height) {
        return Result<void>::err(
                "EncodeError: frame does not match encoder configuration "
                "(" + std::to_string(codecCtx_->width) + "x" +
                        std::to_string(codecCtx_->height) + " yuv420p)",
                ErrorCode::Codec);
    }

    int ret = avcodec_send_frame(codecCtx_.get(), frame);
    if (ret < 0) {
        return Result<void>::err("EncodeError: " + ffmpegError(ret),
                                 ErrorCode::Codec);
    }
    ++framesSent_;
    return Result<void>::ok();
}

Result<PacketList> VideoEncoder::receivePackets() {
    PacketList packets;
    if (!codecCtx_)
        return Result<PacketList>::ok(std::move(packets));

    int ret = drainPackets(codecCtx_.get(), packets);
    if (ret < 0) {
        return Result<PacketList>::err(
                "Failed to receive video packet: " + ffmpegError(ret),
                ErrorCode::Codec);
    }
    return Result<PacketList>::ok(std::move(packets));
}

Result<PacketList> VideoEncoder::finish() {
    if (!codecCtx_ || finished_)
        return Result<PacketList>::ok(PacketList{});

    finished_ = true;
    int ret = avcodec_send_frame(codecCtx_.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return Result<PacketList>::err(
                "Failed to flush video encoder: " + ffmpegError(ret),
                ErrorCode::Codec);
    }
    return receivePackets();
}

i64 VideoEncoder::ptsForFrame(i64 frameIndex) const {
    return frameToPts(frameIndex, settings_.fps, timeBase().den);
}

AVRational VideoEncoder::timeBase() const {
    if (codecCtx_)
        return codecCtx_->time_base;
    return AVRational{1, static_cast<int>(videoTicksPerSecond(settings_.fps))};
}

} // namespace mw
