/**
 * @file Types.hpp
 * @brief Fixed-width aliases and time types shared across the project.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace mw {

namespace fs = std::filesystem;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

struct Size {
    u32 width{0};
    u32 height{0};

    bool isEmpty() const {
        return width == 0 || height == 0;
    }
};

} // namespace mw
