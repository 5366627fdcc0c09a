/**
 * @file AudioEncoder.hpp
 * @brief Block audio codec wrapper (Opus, 48 kHz).
 *
 * Takes exactly frameSize() interleaved float samples per channel per
 * send(). When the codec wants another sample layout (planar, s16) the
 * samples go through libswresample first. Timestamps are sample counts, so
 * they stay exact no matter how the host paces its audio callbacks.
 */

#pragma once
#include <span>
#include "Encoder.hpp"
#include "EncoderSettings.hpp"

namespace mw {

class AudioEncoder : public Encoder {
public:
    // 20 ms at 48 kHz
    static constexpr u32 kOpusFrameSize = 960;

    AudioEncoder();
    ~AudioEncoder() override;

    Result<void> init(const AudioEncoderSettings& settings, bool globalHeader);

    Result<void> send(std::span<const f32> interleaved);
    Result<PacketList> receivePackets() override;
    Result<PacketList> finish() override;

    AVRational timeBase() const override;
    const AVCodecContext* context() const override {
        return codecCtx_.get();
    }
    const char* kind() const override {
        return "audio";
    }

    u32 frameSize() const {
        return frameSize_;
    }
    u32 channels() const {
        return settings_.channels;
    }
    u32 sampleRate() const {
        return settings_.sampleRate;
    }
    i64 framesSent() const {
        return framesSent_;
    }
    // Per channel, including padding.
    i64 samplesSent() const {
        return framesSent_ * frameSize_;
    }

private:
    Result<void> initResampler();

    AudioEncoderSettings settings_;
    AVCodecContextPtr codecCtx_;
    SwrContextPtr swrCtx_;
    AVFramePtr frame_;
    u32 frameSize_{kOpusFrameSize};
    i64 framesSent_{0};
    bool finished_{false};
};

} // namespace mw
