/**
 * @file Encoder.hpp
 * @brief Common face of the block codec wrappers, as seen by the Muxer.
 */

#pragma once
#include "FFmpegUtils.hpp"
#include "util/Result.hpp"

namespace mw {

class Encoder {
public:
    virtual ~Encoder() = default;

    // Packets the codec has ready after the last send(); may be empty.
    virtual Result<PacketList> receivePackets() = 0;
    // Signals end of stream and drains everything still buffered.
    virtual Result<PacketList> finish() = 0;

    virtual AVRational timeBase() const = 0;
    virtual const AVCodecContext* context() const = 0;
    virtual const char* kind() const = 0;
};

} // namespace mw
