#include "PcmConvert.hpp"
#include <cmath>
#include <limits>

namespace mw::pcm {

namespace {
constexpr i32 kMax = std::numeric_limits<i32>::max();
constexpr i32 kMin = std::numeric_limits<i32>::min();
} // namespace

f32 toFloat(i32 sample) {
    if (sample == kMin)
        return -1.0f;
    return static_cast<f32>(static_cast<f64>(sample) / kMax);
}

i32 toInt32(f32 sample) {
    if (std::isnan(sample))
        return 0;
    f64 scaled = std::round(static_cast<f64>(sample) * kMax);
    if (scaled >= static_cast<f64>(kMax))
        return kMax;
    if (scaled <= -static_cast<f64>(kMax))
        return -kMax;
    return static_cast<i32>(scaled);
}

void toFloat(std::span<const i32> in, std::vector<f32>& out) {
    out.resize(in.size());
    for (usize i = 0; i < in.size(); ++i)
        out[i] = toFloat(in[i]);
}

std::vector<f32> toFloat(std::span<const i32> in) {
    std::vector<f32> out;
    toFloat(in, out);
    return out;
}

} // namespace mw::pcm
