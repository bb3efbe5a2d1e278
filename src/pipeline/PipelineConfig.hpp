// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

namespace srtvoice
{

/// @brief Timing policy and output format for one TimingAssembler build.
struct PipelineConfig
{
    /// @brief Pad speech that is shorter than its slot with silence up to the slot length.
    bool fillToEnd = true;

    /// @brief Truncate overflowing speech to its slot instead of speeding it up.
    bool hardCut = false;

    /// @brief Silence before the first cue; it occupies the start of the cue timeline.
    int padLeadingMs = 0;

    /// @brief Silence appended after the last cue.
    int padTrailingMs = 0;

    /// @brief Maximum code points per backend request.
    int maxCharsPerCall = 4000;

    /// @brief Upper bound of the speed-up applied to overflowing speech.
    double maxSpeedup = 1.15;

    /// @brief Output track sample rate; every cue is converted to it.
    int sampleRate = 24000;

    /// @brief Output track channel count (1 or 2).
    int channels = 1;

    /// @brief Number of cues synthesized concurrently ahead of the assembly.
    int workerCount = 4;
};

/// @brief Checks a pipeline configuration before any work starts.
/// @return Success, or a ConfigError describing the first invalid field.
[[nodiscard]] auto validate(const PipelineConfig& config) -> VoidResult;

} // namespace srtvoice
