/**
 * @file VideoEncoder.hpp
 * @brief Block video codec wrapper (VP9 by default).
 *
 * Owns the codec context and one reusable planar frame. The caller fills
 * the frame returned by acquireFrame(), stamps its pts and hands it back
 * through send(). Quality tiers are translated into codec private options
 * here and nowhere else.
 */

#pragma once
#include "Encoder.hpp"
#include "EncoderSettings.hpp"

namespace mw {

class VideoEncoder : public Encoder {
public:
    VideoEncoder();
    ~VideoEncoder() override;

    Result<void> init(const VideoEncoderSettings& settings, bool globalHeader);

    // The encoder's frame, made writable. Valid until the next call.
    Result<AVFrame*> acquireFrame();

    Result<void> send(const AVFrame* frame);
    Result<PacketList> receivePackets() override;
    Result<PacketList> finish() override;

    // PTS of the frameIndex-th frame in timeBase().
    i64 ptsForFrame(i64 frameIndex) const;

    AVRational timeBase() const override;
    const AVCodecContext* context() const override {
        return codecCtx_.get();
    }
    const char* kind() const override {
        return "video";
    }

    const VideoEncoderSettings& settings() const {
        return settings_;
    }
    i64 framesSent() const {
        return framesSent_;
    }

private:
    void applyQuality(AVDictionary** opts) const;

    VideoEncoderSettings settings_;
    AVCodecContextPtr codecCtx_;
    AVFramePtr frame_;
    i64 framesSent_{0};
    bool finished_{false};
};

} // namespace mw
