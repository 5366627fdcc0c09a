/**
 * @file Muxer.hpp
 * @brief Output container: streams, header, interleaved packets, trailer.
 *
 * Streams are declared up front from fully opened encoders. Once the header
 * is written the stream set is frozen. Every packet is rescaled from the time
 * base of the encoder that produced it into its stream's time base before it
 * reaches the interleaving writer.
 *
 * @section Dependencies
 * - FFmpeg (libavformat)
 */

#pragma once
#include <string>
#include <vector>
#include "Encoder.hpp"
#include "util/Types.hpp"

namespace mw {

class Muxer {
public:
    Muxer();
    // Writes a best-effort trailer if finish() never ran. A file whose
    // header was never written is deleted.
    ~Muxer();

    Muxer(const Muxer&) = delete;
    Muxer& operator=(const Muxer&) = delete;

    // Picks the container from the extension and opens the file.
    Result<void> open(const fs::path& path);

    // True if the container can store this codec.
    bool supportsCodec(AVCodecID codecId) const;
    // Encoders must be opened with AV_CODEC_FLAG_GLOBAL_HEADER when true.
    bool needsGlobalHeader() const;

    // Registers encoder's output as a new stream. The encoder must outlive
    // the muxer's finish().
    Result<int> addStream(Encoder& encoder);
    Result<int> addVideoStream(Encoder& encoder) {
        return addStream(encoder);
    }
    Result<int> addAudioStream(Encoder& encoder) {
        return addStream(encoder);
    }

    // Packets that would take the payload past bytes are refused with an
    // Io error. 0 lifts the limit.
    void setSizeLimit(u64 bytes) {
        sizeLimit_ = bytes;
    }
    u64 sizeLimit() const {
        return sizeLimit_;
    }

    Result<void> writeHeader();
    Result<void> writePacket(int streamId, AVPacket* packet);
    Result<void> writePackets(int streamId, PacketList& packets);

    // Flushes the registered encoders in registration order, writes what
    // they still hold, then the trailer. The trailer is attempted even when
    // a flush fails; the first error is returned.
    Result<void> finish();

    bool isOpen() const {
        return formatCtx_ != nullptr;
    }
    bool headerWritten() const {
        return headerWritten_;
    }
    bool trailerWritten() const {
        return trailerWritten_;
    }
    usize streamCount() const {
        return streams_.size();
    }
    u64 bytesWritten() const {
        return bytesWritten_;
    }
    i64 packetsWritten() const {
        return packetsWritten_;
    }
    const fs::path& path() const {
        return path_;
    }

private:
    struct StreamEntry {
        AVStream* stream{nullptr};
        Encoder* encoder{nullptr};
        AVRational encoderTimeBase{0, 1};
        i64 lastPts{AV_NOPTS_VALUE};
    };

    Result<void> writeTrailer();

    AVFormatContextPtr formatCtx_;
    std::vector<StreamEntry> streams_;
    fs::path path_;
    bool headerWritten_{false};
    bool trailerWritten_{false};
    u64 bytesWritten_{0};
    u64 sizeLimit_{0};
    i64 packetsWritten_{0};
};

} // namespace mw
