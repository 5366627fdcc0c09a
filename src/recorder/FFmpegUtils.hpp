/**
 * @file FFmpegUtils.hpp
 * @brief RAII holders, error helpers and log routing for the FFmpeg C API.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libavutil, libswresample)
 */

#pragma once
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

#include <memory>
#include <string>
#include <vector>

namespace mw {

struct AVFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (!ctx)
            return;
        if (ctx->oformat && !(ctx->oformat->flags & AVFMT_NOFILE))
            avio_closep(&ctx->pb);
        avformat_free_context(ctx);
    }
};

struct AVCodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        av_frame_free(&frame);
    }
};

struct AVPacketDeleter {
    void operator()(AVPacket* packet) const {
        av_packet_free(&packet);
    }
};

struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const {
        swr_free(&ctx);
    }
};

struct AVDictionaryDeleter {
    void operator()(AVDictionary* dict) const {
        av_dict_free(&dict);
    }
};

using AVFormatContextPtr =
        std::unique_ptr<AVFormatContext, AVFormatContextDeleter>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;

using PacketList = std::vector<AVPacketPtr>;

std::string ffmpegError(int errnum);

// Sends libav* messages through the spdlog logger, tagged "[libav]".
// verbose lowers FFmpeg's threshold from warnings to verbose output.
void routeFFmpegLogs(bool verbose);

// Moves every packet the codec has ready into out. Returns 0 once the codec
// wants more input (EAGAIN) or is drained (EOF), a negative error otherwise.
int drainPackets(AVCodecContext* ctx, PacketList& out);

} // namespace mw
