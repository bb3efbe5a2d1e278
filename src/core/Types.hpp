// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace srtvoice
{

/// @brief Millisecond duration used for all cue and audio timing.
using Milliseconds = std::chrono::milliseconds;

/// @brief Encoded audio as returned by a synthesis backend (WAV, MP3, FLAC, ...).
using AudioBytes = std::vector<std::uint8_t>;

/// @brief One subtitle entry: a time slot and the text to be spoken in it.
///
/// Cues are produced by the subtitle loader ordered by start time and are
/// consumed once by the TimingAssembler.
struct Cue
{
    int index = 0;
    Milliseconds start { 0 };
    Milliseconds end { 0 };
    std::string text;

    /// @brief Returns the length of the cue's slot, clamped to zero for inverted timings.
    [[nodiscard]] auto slot() const -> Milliseconds { return end > start ? end - start : Milliseconds { 0 }; }
};

} // namespace srtvoice
