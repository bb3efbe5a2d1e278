// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "Types.hpp"

namespace srtvoice
{

/// @brief Clamps a value into the inclusive range [minValue, maxValue].
///
/// All speed-cap decisions go through this function.
template <typename T>
[[nodiscard]] constexpr auto clamp(T value, T minValue, T maxValue) -> T
{
    if (value < minValue)
        return minValue;
    if (value > maxValue)
        return maxValue;
    return value;
}

/// @brief Returns true if two positive values differ by no more than a relative tolerance.
[[nodiscard]] inline auto isClose(double a, double b, double relativeTolerance) -> bool
{
    return std::abs(a - b) <= relativeTolerance * std::max(std::abs(a), std::abs(b));
}

/// @brief Converts a duration to a frame count at the given sample rate, rounding to the nearest frame.
[[nodiscard]] inline auto framesForDuration(Milliseconds duration, unsigned sampleRate) -> std::uint64_t
{
    if (duration.count() <= 0)
        return 0;
    return static_cast<std::uint64_t>(
        std::llround(static_cast<double>(duration.count()) * static_cast<double>(sampleRate) / 1000.0));
}

/// @brief Converts a frame count to milliseconds, rounding to the nearest millisecond.
[[nodiscard]] inline auto durationForFrames(std::uint64_t frames, unsigned sampleRate) -> Milliseconds
{
    if (sampleRate == 0)
        return Milliseconds { 0 };
    return Milliseconds { std::llround(static_cast<double>(frames) * 1000.0 / static_cast<double>(sampleRate)) };
}

} // namespace srtvoice
