// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <synthesis/SynthesisBackend.hpp>

#include <optional>
#include <string>

namespace srtvoice
{

/// @brief Settings for the ElevenLabs text-to-speech endpoint.
struct ElevenLabsConfig
{
    std::string voiceId;
    std::string modelId = "eleven_multilingual_v2";

    /// @brief Codec_samplerate_bitrate string such as "mp3_44100_128".
    std::string outputFormat = "mp3_44100_128";

    std::optional<float> stability;
    std::optional<float> similarityBoost;
    std::optional<float> style;
    std::optional<bool> useSpeakerBoost;

    std::string baseUrl = "https://api.elevenlabs.io/v1";

    /// @brief API key; never part of the fingerprint.
    std::string apiKey;
};

/// @brief Maps an ElevenLabs output format to a file extension ("mp3", "ogg", "wav"; "mp3" otherwise).
[[nodiscard]] auto elevenLabsFileExtension(std::string_view outputFormat) -> std::string;

/// @brief Synthesizes speech through ElevenLabs' /text-to-speech/<voice> endpoint.
class ElevenLabsBackend: public SynthesisBackend
{
  public:
    explicit ElevenLabsBackend(ElevenLabsConfig config);

    [[nodiscard]] auto identity() const -> std::string override { return "elevenlabs"; }
    [[nodiscard]] auto outputFormat() const -> std::string override;
    [[nodiscard]] auto configFingerprint() const -> nlohmann::json override;
    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioBytes> override;

    /// @brief Builds the JSON request body for a text.
    [[nodiscard]] auto requestBody(std::string_view text) const -> nlohmann::json;

  private:
    ElevenLabsConfig _config;
};

} // namespace srtvoice
