/**
 * @file AudioFramer.hpp
 * @brief Regroups interleaved audio into fixed-size codec frames.
 *
 * Hosts deliver audio in blocks sized by their own mix rate and frame rate;
 * block codecs want exactly frameSize samples per channel. The framer
 * queues whatever arrives and hands out full frames in input order.
 */

#pragma once
#include <deque>
#include <optional>
#include <span>
#include <vector>
#include "util/Types.hpp"

namespace mw {

class AudioFramer {
public:
    AudioFramer(u32 frameSize, u32 channels);

    void push(std::span<const f32> samples);

    // Exactly frameSize * channels samples, or nothing if not enough are
    // queued yet.
    std::optional<std::vector<f32>> popFrame();

    // End of stream: the remaining partial frame padded up to a full one,
    // or nothing when the queue is empty.
    std::optional<std::vector<f32>> drainFinal(f32 padding = 0.0f);

    u32 frameSize() const {
        return frameSize_;
    }
    u32 channels() const {
        return channels_;
    }
    usize frameSamples() const {
        return static_cast<usize>(frameSize_) * channels_;
    }

    // Interleaved samples waiting for the next frame.
    usize pendingSamples() const {
        return queue_.size();
    }
    u64 framesEmitted() const {
        return framesEmitted_;
    }
    // Per channel, padding included.
    u64 samplesEmitted() const {
        return framesEmitted_ * frameSize_;
    }

private:
    std::vector<f32> take(usize count);

    u32 frameSize_;
    u32 channels_;
    std::deque<f32> queue_;
    u64 framesEmitted_{0};
};

} // namespace mw
