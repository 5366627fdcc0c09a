#include "Muxer.hpp"
#include <system_error>
#include "core/Logger.hpp"

namespace mw {

Muxer::Muxer() = default;

Muxer::~Muxer() {
    if (headerWritten_ && !trailerWritten_) {
        LOG_WARN("Muxer destroyed before finish, writing trailer for {}",
                 path_.string());
        if (auto result = writeTrailer(); !result) {
            LOG_ERROR("{}", result.error().message);
        }
    } else if (isOpen() && !headerWritten_) {
        // Without a header the file is not playable; leave nothing behind.
        formatCtx_.reset();
        std::error_code ec;
        if (fs::remove(path_, ec)) {
            LOG_DEBUG("Removed unfinished output {}", path_.string());
        } else if (ec) {
            LOG_WARN("Could not remove unfinished output {}: {}",
                     path_.string(),
                     ec.message());
        }
    }
}

Result<void> Muxer::open(const fs::path& path) {
    if (formatCtx_) {
        return Result<void>::err("Muxer already open", ErrorCode::State);
    }
    path_ = path;
    std::string filename = path.string();

    AVFormatContext* ctx = nullptr;
    int ret = avformat_alloc_output_context2(
            &ctx, nullptr, nullptr, filename.c_str());
    if (ret < 0 || !ctx) {
        return Result<void>::err("No container format for " + filename + ": " +
                                         ffmpegError(ret),
                                 ErrorCode::Format);
    }
    formatCtx_.reset(ctx);

    if (!(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&formatCtx_->pb, filename.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            formatCtx_.reset();
            return Result<void>::err(
                    "Could not open output file " + filename + ": " +
                            ffmpegError(ret),
                    ErrorCode::Io);
        }
    }

    LOG_DEBUG("Muxer opened {} ({})", filename, formatCtx_->oformat->name);
    return Result<void>::ok();
}

bool Muxer::supportsCodec(AVCodecID codecId) const {
    if (!formatCtx_)
        return false;
    return avformat_query_codec(
                   formatCtx_->oformat, codecId, FF_COMPLIANCE_NORMAL) == 1;
}

bool Muxer::needsGlobalHeader() const {
    return formatCtx_ && (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER);
}

Result<int> Muxer::addStream(Encoder& encoder) {
    if (!formatCtx_) {
        return Result<int>::err("Muxer not open", ErrorCode::State);
    }
    if (headerWritten_) {
        return Result<int>::err("Cannot add a stream after the header",
                                ErrorCode::State);
    }
    const AVCodecContext* codecCtx = encoder.context();
    if (!codecCtx) {
        return Result<int>::err(std::string("Encoder for ") + encoder.kind() +
                                        " stream is not open",
                                ErrorCode::State);
    }

    AVStream* stream = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!stream) {
        return Result<int>::err("Failed to create output stream",
                                ErrorCode::Format);
    }

    int ret = avcodec_parameters_from_context(stream->codecpar, codecCtx);
    if (ret < 0) {
        return Result<int>::err("Failed to copy codec parameters: " +
                                        ffmpegError(ret),
                                ErrorCode::Codec);
    }
    stream->time_base = encoder.timeBase();
    if (codecCtx->codec_type == AVMEDIA_TYPE_VIDEO) {
        stream->avg_frame_rate = codecCtx->framerate;
    }

    StreamEntry entry;
    entry.stream = stream;
    entry.encoder = &encoder;
    entry.encoderTimeBase = encoder.timeBase();
    streams_.push_back(entry);

    LOG_DEBUG("Added {} stream #{} ({})",
              encoder.kind(),
              stream->index,
              avcodec_get_name(codecCtx->codec_id));
    return Result<int>::ok(stream->index);
}

Result<void> Muxer::writeHeader() {
    if (!formatCtx_) {
        return Result<void>::err("Muxer not open", ErrorCode::State);
    }
    if (headerWritten_) {
        return Result<void>::err("Header already written", ErrorCode::State);
    }
    if (streams_.empty()) {
        return Result<void>::err("No streams to write", ErrorCode::State);
    }

    int ret = avformat_write_header(formatCtx_.get(), nullptr);
    if (ret < 0) {
        return Result<void>::err(
                "Failed to write container header: " + ffmpegError(ret),
                ErrorCode::Io);
    }
    headerWritten_ = true;

    // The muxer may have chosen its own stream time bases.
    for (const auto& entry : streams_) {
        LOG_TRACE("Stream #{} time base {}/{} (encoder {}/{})",
                  entry.stream->index,
                  entry.stream->time_base.num,
                  entry.stream->time_base.den,
                  entry.encoderTimeBase.num,
                  entry.encoderTimeBase.den);
    }
    return Result<void>::ok();
}

Result<void> Muxer::writePacket(int streamId, AVPacket* packet) {
    if (!headerWritten_ || trailerWritten_) {
        return Result<void>::err("Muxer is not accepting packets",
                                 ErrorCode::State);
    }
    if (streamId < 0 || static_cast<usize>(streamId) >= streams_.size()) {
        return Result<void>::err("Unknown stream " + std::to_string(streamId),
                                 ErrorCode::State);
    }
    if (!packet) {
        return Result<void>::err("Null packet", ErrorCode::Codec);
    }

    StreamEntry& entry = streams_[static_cast<usize>(streamId)];
    av_packet_rescale_ts(packet, entry.encoderTimeBase, entry.stream->time_base);
    packet->stream_index = entry.stream->index;

    if (packet->pts != AV_NOPTS_VALUE) {
        if (entry.lastPts != AV_NOPTS_VALUE && packet->pts < entry.lastPts) {
            return Result<void>::err(
                    "Timestamp regression on stream " +
                            std::to_string(streamId) + ": " +
                            std::to_string(packet->pts) + " < " +
                            std::to_string(entry.lastPts),
                    ErrorCode::Codec);
        }
        entry.lastPts = packet->pts;
    }

    int size = packet->size;
    if (sizeLimit_ > 0 && bytesWritten_ + static_cast<u64>(size) > sizeLimit_) {
        return Result<void>::err("Output size limit of " +
                                         std::to_string(sizeLimit_) +
                                         " bytes reached",
                                 ErrorCode::Io);
    }
    int ret = av_interleaved_write_frame(formatCtx_.get(), packet);
    if (ret < 0) {
        return Result<void>::err("Failed to write packet: " + ffmpegError(ret),
                                 ErrorCode::Io);
    }
    bytesWritten_ += static_cast<u64>(size);
    ++packetsWritten_;
    return Result<void>::ok();
}

Result<void> Muxer::writePackets(int streamId, PacketList& packets) {
    for (auto& packet : packets) {
        if (auto result = writePacket(streamId, packet.get()); !result) {
            return result;
        }
    }
    packets.clear();
    return Result<void>::ok();
}

Result<void> Muxer::finish() {
    if (!headerWritten_) {
        return Result<void>::err("Header was never written", ErrorCode::State);
    }
    if (trailerWritten_) {
        return Result<void>::ok();
    }

    auto firstError = Result<void>::ok();
    for (usize i = 0; i < streams_.size(); ++i) {
        Encoder* encoder = streams_[i].encoder;
        auto flushed = encoder->finish();
        if (!flushed) {
            LOG_ERROR("Flushing {} encoder failed: {}",
                      encoder->kind(),
                      flushed.error().message);
            if (firstError)
                firstError = Result<void>::err(flushed.error());
            continue;
        }
        auto written = writePackets(static_cast<int>(i), *flushed);
        if (!written) {
            LOG_ERROR("Writing flushed {} packets failed: {}",
                      encoder->kind(),
                      written.error().message);
            if (firstError)
                firstError = written;
        }
    }

    auto trailer = writeTrailer();
    if (!trailer && firstError)
        return trailer;
    return firstError;
}

Result<void> Muxer::writeTrailer() {
    trailerWritten_ = true;
    int ret = av_write_trailer(formatCtx_.get());
    if (ret < 0) {
        return Result<void>::err("Failed to write trailer: " + ffmpegError(ret),
                                 ErrorCode::Io);
    }
    if (formatCtx_->pb) {
        avio_flush(formatCtx_->pb);
    }
    LOG_DEBUG("Trailer written to {} ({} packets, {} bytes)",
              path_.string(),
              packetsWritten_,
              bytesWritten_);
    return Result<void>::ok();
}

} // namespace mw
