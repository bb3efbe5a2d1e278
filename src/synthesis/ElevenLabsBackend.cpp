// SPDX-License-Identifier: Apache-2.0
#include "ElevenLabsBackend.hpp"

#include <synthesis/HttpRequest.hpp>

#include <format>

namespace srtvoice
{

namespace
{

    template <typename T>
    auto optionalToJson(const std::optional<T>& value) -> nlohmann::json
    {
        if (value)
            return *value;
        return nullptr;
    }

} // namespace

auto elevenLabsFileExtension(std::string_view outputFormat) -> std::string
{
    if (outputFormat.starts_with("mp3"))
        return "mp3";
    if (outputFormat.starts_with("ogg"))
        return "ogg";
    if (outputFormat.starts_with("wav"))
        return "wav";
    return "mp3";
}

ElevenLabsBackend::ElevenLabsBackend(ElevenLabsConfig config): _config(std::move(config))
{
}

auto ElevenLabsBackend::outputFormat() const -> std::string
{
    return elevenLabsFileExtension(_config.outputFormat);
}

auto ElevenLabsBackend::configFingerprint() const -> nlohmann::json
{
    return nlohmann::json {
        { "voiceId", _config.voiceId },
        { "modelId", _config.modelId },
        { "outputFormat", _config.outputFormat },
        { "stability", optionalToJson(_config.stability) },
        { "similarityBoost", optionalToJson(_config.similarityBoost) },
        { "style", optionalToJson(_config.style) },
        { "useSpeakerBoost", optionalToJson(_config.useSpeakerBoost) },
    };
}

auto ElevenLabsBackend::requestBody(std::string_view text) const -> nlohmann::json
{
    auto body = nlohmann::json {
        { "text", std::string(text) },
        { "model_id", _config.modelId },
    };

    auto settings = nlohmann::json::object();
    if (_config.stability)
        settings["stability"] = *_config.stability;
    if (_config.similarityBoost)
        settings["similarity_boost"] = *_config.similarityBoost;
    if (_config.style)
        settings["style"] = *_config.style;
    if (_config.useSpeakerBoost)
        settings["use_speaker_boost"] = *_config.useSpeakerBoost;
    if (!settings.empty())
        body["voice_settings"] = std::move(settings);

    return body;
}

auto ElevenLabsBackend::synthesize(std::string_view text) -> Result<AudioBytes>
{
    if (_config.apiKey.empty())
        return makeError(ErrorCode::FatalSynthesisError, "ELEVENLABS_API_KEY is not set");
    if (_config.voiceId.empty())
        return makeError(ErrorCode::FatalSynthesisError, "No ElevenLabs voice id configured");

    auto const request = HttpRequest {
        .url = std::format(
            "{}/text-to-speech/{}?output_format={}", _config.baseUrl, _config.voiceId, _config.outputFormat),
        .headers = {
            "xi-api-key: " + _config.apiKey,
            "Content-Type: application/json",
        },
        .body = requestBody(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
    };

    auto response = performHttpRequest(request);
    if (!response)
        return std::unexpected(response.error());
    if (!response->ok())
        return std::unexpected(httpFailure("ElevenLabs", *response));
    if (response->body.empty())
        return makeError(ErrorCode::TransientSynthesisError, "ElevenLabs returned an empty audio body");

    return std::move(response->body);
}

} // namespace srtvoice
