// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace srtvoice
{

/// @brief Abstract interface for a text-to-speech provider.
///
/// The core only depends on this interface. synthesize() may be called concurrently
/// from several synthesis workers; implementations that wrap non-reentrant engines
/// must serialize internally.
class SynthesisBackend
{
  public:
    virtual ~SynthesisBackend() = default;

    /// @brief Returns the unique provider identifier (e.g. "openai"), used as cache namespace.
    [[nodiscard]] virtual auto identity() const -> std::string = 0;

    /// @brief Returns the file extension of the audio this backend produces (e.g. "mp3").
    [[nodiscard]] virtual auto outputFormat() const -> std::string = 0;

    /// @brief Returns every configuration value that affects the synthesized audio.
    ///
    /// Becomes part of the cache key, so adding a field here invalidates existing entries.
    [[nodiscard]] virtual auto configFingerprint() const -> nlohmann::json = 0;

    /// @brief Renders text to encoded audio.
    /// @param text The text to speak.
    /// @return The encoded audio, or an error coded TransientSynthesisError (worth
    ///         retrying) or FatalSynthesisError (retrying cannot help).
    [[nodiscard]] virtual auto synthesize(std::string_view text) -> Result<AudioBytes> = 0;
};

} // namespace srtvoice
