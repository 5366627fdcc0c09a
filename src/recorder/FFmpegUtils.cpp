#include "FFmpegUtils.hpp"
#include <cstdarg>
extern "C" {
#include <libavcodec/version.h>
#include <libavformat/version.h>
}
#include "core/Logger.hpp"

namespace mw {

namespace {

spdlog::level::level_enum toSpdlogLevel(int level) {
    if (level <= AV_LOG_FATAL)
        return spdlog::level::critical;
    if (level <= AV_LOG_ERROR)
        return spdlog::level::err;
    if (level <= AV_LOG_WARNING)
        return spdlog::level::warn;
    if (level <= AV_LOG_INFO)
        return spdlog::level::info;
    if (level <= AV_LOG_DEBUG)
        return spdlog::level::debug;
    return spdlog::level::trace;
}

void ffmpegLogCallback(void* avcl, int level, const char* fmt, va_list vl) {
    if (level > av_log_get_level())
        return;

    // FFmpeg may build one line from several calls.
    thread_local int printPrefix = 1;
    char line[1024];
    av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &printPrefix);

    std::string_view text(line);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.remove_suffix(1);
    if (text.empty())
        return;
    Logger::get()->log(toSpdlogLevel(level), "[libav] {}", text);
}

} // namespace

void routeFFmpegLogs(bool verbose) {
    av_log_set_level(verbose ? AV_LOG_VERBOSE : AV_LOG_WARNING);
    av_log_set_callback(ffmpegLogCallback);
    LOG_DEBUG("FFmpeg {} / {} / {}",
              LIBAVCODEC_IDENT,
              LIBAVFORMAT_IDENT,
              LIBAVUTIL_IDENT);
}

std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

int drainPackets(AVCodecContext* ctx, PacketList& out) {
    while (true) {
        AVPacketPtr packet(av_packet_alloc());
        if (!packet)
            return AVERROR(ENOMEM);

        int ret = avcodec_receive_packet(ctx, packet.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return 0;
        if (ret < 0)
            return ret;

        out.push_back(std::move(packet));
    }
}

} // namespace mw
