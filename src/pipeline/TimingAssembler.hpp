// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegment.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/PipelineConfig.hpp>
#include <synthesis/SpeechSynthesizer.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace srtvoice
{

/// @brief How a cue's speech was reconciled with its slot.
enum class SlotFit : std::uint8_t
{
    Fits,      ///< Shorter than the slot, emitted as-is.
    Padded,    ///< Shorter than the slot, padded with silence to the slot length.
    HardCut,   ///< Longer than the slot, truncated to it.
    SpedUp,    ///< Longer than the slot, sped up to exactly fill it.
    Overflow,  ///< Longer than the slot even at the maximum speed-up.
    Unslotted, ///< Zero-length slot, emitted as-is.
};

/// @brief Where one cue ended up in the assembled track.
struct CuePlacement
{
    int cueIndex = 0;
    Milliseconds position { 0 };
    Milliseconds slot { 0 };
    Milliseconds rawDuration { 0 };
    Milliseconds emittedDuration { 0 };
    double speed = 1.0;
    SlotFit fit = SlotFit::Fits;
};

/// @brief Assembles synthesized cue audio into one track that follows the cue timings.
///
/// Cue audio is synthesized by a bounded pool of workers ahead of the assembly, which
/// itself runs strictly in cue order on the calling thread: gap-fill up to the cue's
/// start, then fit the speech to the slot by padding, truncation or a capped speed-up.
class TimingAssembler
{
  public:
    /// @brief Constructs a TimingAssembler.
    /// @param synthesizer The synthesizer used for every chunk.
    /// @param config Timing policy and output format.
    TimingAssembler(SpeechSynthesizer& synthesizer, PipelineConfig config);

    /// @brief Builds the track for the given cues.
    ///
    /// The configuration is validated before any synthesis. The first synthesis failure
    /// aborts the build; audio already written to the cache is kept for the next run.
    /// @param cues Cues ordered by start time.
    /// @return The assembled track, or ConfigError/SynthesisFailure naming the cue.
    [[nodiscard]] auto build(std::span<const Cue> cues) -> Result<AudioSegment>;

    /// @brief Returns the pipeline configuration.
    [[nodiscard]] auto config() const noexcept -> const PipelineConfig& { return _config; }

    /// @brief Returns the placement of every cue of the last successful build.
    [[nodiscard]] auto placements() const noexcept -> const std::vector<CuePlacement>& { return _placements; }

  private:
    [[nodiscard]] auto synthesizeCue(const Cue& cue) const -> Result<AudioSegment>;
    [[nodiscard]] auto fitToSlot(const AudioSegment& raw, Milliseconds slot, CuePlacement& placement) const
        -> Result<AudioSegment>;

    SpeechSynthesizer& _synthesizer;
    PipelineConfig _config;
    std::vector<CuePlacement> _placements;
};

} // namespace srtvoice
