// SPDX-License-Identifier: Apache-2.0
#include "BackendFactory.hpp"

#include <core/Log.hpp>
#include <synthesis/ElevenLabsBackend.hpp>
#include <synthesis/OpenAiBackend.hpp>
#include <synthesis/PiperBackend.hpp>

#include <cstdlib>
#include <format>

namespace srtvoice
{

namespace
{

    auto readSecret(std::string_view name, const EnvironmentLookup& lookup) -> std::string
    {
        if (lookup)
            return lookup(name).value_or(std::string {});
        auto const* const value = std::getenv(std::string(name).c_str());
        return value ? std::string(value) : std::string {};
    }

} // namespace

auto createBackend(const AppConfig& config, const EnvironmentLookup& lookup)
    -> Result<std::unique_ptr<SynthesisBackend>>
{
    if (config.provider == "openai")
    {
        auto openai = config.openai;
        if (openai.apiKey.empty())
            openai.apiKey = readSecret("OPENAI_API_KEY", lookup);
        if (openai.apiKey.empty())
            log::warning("OPENAI_API_KEY is not set; uncached requests will fail");
        return std::make_unique<OpenAiBackend>(std::move(openai));
    }

    if (config.provider == "elevenlabs")
    {
        auto elevenLabs = config.elevenLabs;
        if (elevenLabs.apiKey.empty())
            elevenLabs.apiKey = readSecret("ELEVENLABS_API_KEY", lookup);
        if (elevenLabs.apiKey.empty())
            log::warning("ELEVENLABS_API_KEY is not set; uncached requests will fail");
        return std::make_unique<ElevenLabsBackend>(std::move(elevenLabs));
    }

    if (config.provider == "piper")
    {
        auto piper = PiperBackend::create(config.piper);
        if (!piper)
            return std::unexpected(piper.error());
        return std::unique_ptr<SynthesisBackend>(std::move(*piper));
    }

    return makeError(ErrorCode::ConfigError, std::format("Unknown provider '{}'", config.provider));
}

} // namespace srtvoice
