// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace srtvoice
{

/// @brief Decoded audio: interleaved float32 PCM with a sample rate and channel count.
///
/// A plain value type. All miniaudio usage is confined to the implementation file.
/// Durations are derived from the frame count and rounded to the nearest millisecond;
/// operations that must be exact (padding, truncation, gap-fill) work in frames.
class AudioSegment
{
  public:
    static constexpr auto DefaultSampleRate = 24000u;
    static constexpr auto DefaultChannels = 1u;

    AudioSegment() = default;

    /// @brief Constructs a segment from interleaved samples.
    /// @param sampleRate Frames per second.
    /// @param channels Samples per frame.
    /// @param samples Interleaved samples; the size should be a multiple of channels.
    AudioSegment(unsigned sampleRate, unsigned channels, std::vector<float> samples = {});

    /// @brief Creates a segment of silence.
    [[nodiscard]] static auto silence(Milliseconds duration,
                                      unsigned sampleRate = DefaultSampleRate,
                                      unsigned channels = DefaultChannels) -> AudioSegment;

    /// @brief Decodes encoded audio bytes (WAV, MP3 or FLAC) at their native rate and channel count.
    /// @param bytes The encoded audio.
    /// @return The decoded segment, or a DecodeError.
    [[nodiscard]] static auto decode(std::span<const std::uint8_t> bytes) -> Result<AudioSegment>;

    /// @brief Encodes the segment as a 16-bit PCM WAV file image.
    [[nodiscard]] auto encodeWav() const -> Result<AudioBytes>;

    /// @brief Writes the segment as a 16-bit PCM WAV file.
    [[nodiscard]] auto writeWav(std::string_view path) const -> VoidResult;

    [[nodiscard]] auto sampleRate() const noexcept -> unsigned { return _sampleRate; }
    [[nodiscard]] auto channels() const noexcept -> unsigned { return _channels; }
    [[nodiscard]] auto frameCount() const noexcept -> std::uint64_t { return _samples.size() / _channels; }
    [[nodiscard]] auto empty() const noexcept -> bool { return _samples.empty(); }
    [[nodiscard]] auto samples() const noexcept -> std::span<const float> { return _samples; }

    /// @brief Returns the duration rounded to the nearest millisecond.
    [[nodiscard]] auto duration() const -> Milliseconds;

    /// @brief Returns a copy converted to another sample rate and channel count.
    [[nodiscard]] auto convertedTo(unsigned sampleRate, unsigned channels) const -> Result<AudioSegment>;

    /// @brief Appends another segment, converting it to this segment's format first if needed.
    [[nodiscard]] auto append(const AudioSegment& other) -> VoidResult;

    /// @brief Appends the given number of silent frames.
    void appendSilence(std::uint64_t frames);

    /// @brief Returns the first `duration` of the segment (or the whole segment if shorter).
    [[nodiscard]] auto truncated(Milliseconds duration) const -> AudioSegment;

    /// @brief Returns a copy with exactly `frames` frames, cutting the tail or padding it with silence.
    [[nodiscard]] auto resizedToFrames(std::uint64_t frames) const -> AudioSegment;

    /// @brief Changes playback speed by frame-rate reinterpretation.
    ///
    /// The samples are reinterpreted at `sampleRate * speed` and resampled back to
    /// `sampleRate`, so the result has round(frameCount / speed) frames. Pitch shifts with
    /// the speed. Speeds within 0.1% of 1.0 return an unchanged copy.
    /// @param speed The speed factor, greater than zero.
    /// @return The transformed segment, or InvalidArgument/AudioError.
    [[nodiscard]] auto withSpeed(double speed) const -> Result<AudioSegment>;

  private:
    unsigned _sampleRate = DefaultSampleRate;
    unsigned _channels = DefaultChannels;
    std::vector<float> _samples;
};

} // namespace srtvoice
