#include "AudioFramer.hpp"
#include <algorithm>

namespace mw {

AudioFramer::AudioFramer(u32 frameSize, u32 channels)
    : frameSize_(std::max(frameSize, 1u)), channels_(std::max(channels, 1u)) {
}

void AudioFramer::push(std::span<const f32> samples) {
    queue_.insert(queue_.end(), samples.begin(), samples.end());
}

std::optional<std::vector<f32>> AudioFramer::popFrame() {
    if (queue_.size() < frameSamples())
        return std::nullopt;
    return take(frameSamples());
}

std::optional<std::vector<f32>> AudioFramer::drainFinal(f32 padding) {
    if (queue_.empty())
        return std::nullopt;

    auto frame = take(std::min(queue_.size(), frameSamples()));
    frame.resize(frameSamples(), padding);
    return frame;
}

std::vector<f32> AudioFramer::take(usize count) {
    std::vector<f32> frame(queue_.begin(), queue_.begin() + count);
    queue_.erase(queue_.begin(), queue_.begin() + count);
    ++framesEmitted_;
    return frame;
}

} // namespace mw
