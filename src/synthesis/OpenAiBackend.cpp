// SPDX-License-Identifier: Apache-2.0
#include "OpenAiBackend.hpp"

#include <synthesis/HttpRequest.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace srtvoice
{

OpenAiBackend::OpenAiBackend(OpenAiConfig config): _config(std::move(config))
{
}

auto OpenAiBackend::outputFormat() const -> std::string
{
    auto format = _config.responseFormat;
    std::ranges::transform(format, format.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return format;
}

auto OpenAiBackend::configFingerprint() const -> nlohmann::json
{
    return nlohmann::json {
        { "model", _config.model },
        { "voice", _config.voice },
        { "responseFormat", _config.responseFormat },
        { "instructions", _config.instructions },
        { "forceLanguage", _config.forceLanguage },
    };
}

auto OpenAiBackend::requestBody(std::string_view text) const -> nlohmann::json
{
    auto input = std::string(text);
    if (!_config.forceLanguage.empty())
        input = std::format("[lang:{}]  {}", _config.forceLanguage, text);

    auto body = nlohmann::json {
        { "model", _config.model },
        { "voice", _config.voice },
        { "input", input },
        { "response_format", _config.responseFormat },
    };
    if (!_config.instructions.empty())
        body["instructions"] = _config.instructions;
    return body;
}

auto OpenAiBackend::synthesize(std::string_view text) -> Result<AudioBytes>
{
    if (_config.apiKey.empty())
        return makeError(ErrorCode::FatalSynthesisError, "OPENAI_API_KEY is not set");

    auto const request = HttpRequest {
        .url = _config.baseUrl + "/audio/speech",
        .headers = {
            "Authorization: Bearer " + _config.apiKey,
            "Content-Type: application/json",
        },
        .body = requestBody(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
    };

    auto response = performHttpRequest(request);
    if (!response)
        return std::unexpected(response.error());
    if (!response->ok())
        return std::unexpected(httpFailure("OpenAI", *response));
    if (response->body.empty())
        return makeError(ErrorCode::TransientSynthesisError, "OpenAI returned an empty audio body");

    return std::move(response->body);
}

} // namespace srtvoice
