/**
 * @file PcmConvert.hpp
 * @brief Conversion between host int32 PCM and normalized float samples.
 *
 * sample / INT32_MAX maps INT32_MIN slightly below -1.0; it is pinned to
 * exactly -1.0 instead so encoders never see an out-of-range value.
 */

#pragma once
#include <span>
#include <vector>
#include "util/Types.hpp"

namespace mw::pcm {

f32 toFloat(i32 sample);
i32 toInt32(f32 sample);

void toFloat(std::span<const i32> in, std::vector<f32>& out);
std::vector<f32> toFloat(std::span<const i32> in);

} // namespace mw::pcm
