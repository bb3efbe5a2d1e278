// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <synthesis/SynthesisBackend.hpp>

#include <string>

namespace srtvoice
{

/// @brief Settings for the OpenAI speech endpoint.
struct OpenAiConfig
{
    std::string model = "gpt-4o-mini-tts";
    std::string voice = "alloy";

    /// @brief Response format; only formats that can be decoded (mp3, wav, flac) are accepted.
    std::string responseFormat = "mp3";

    /// @brief Optional style instructions for instruction-following models.
    std::string instructions;

    /// @brief Optional language code; the input is then prefixed with "[lang:<code>]".
    std::string forceLanguage;

    std::string baseUrl = "https://api.openai.com/v1";

    /// @brief API key; never part of the fingerprint.
    std::string apiKey;
};

/// @brief Synthesizes speech through OpenAI's /audio/speech endpoint.
class OpenAiBackend: public SynthesisBackend
{
  public:
    explicit OpenAiBackend(OpenAiConfig config);

    [[nodiscard]] auto identity() const -> std::string override { return "openai"; }
    [[nodiscard]] auto outputFormat() const -> std::string override;
    [[nodiscard]] auto configFingerprint() const -> nlohmann::json override;
    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioBytes> override;

    /// @brief Builds the JSON request body for a text.
    [[nodiscard]] auto requestBody(std::string_view text) const -> nlohmann::json;

  private:
    OpenAiConfig _config;
};

} // namespace srtvoice
