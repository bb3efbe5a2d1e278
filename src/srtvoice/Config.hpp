// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/PipelineConfig.hpp>
#include <synthesis/ElevenLabsBackend.hpp>
#include <synthesis/OpenAiBackend.hpp>
#include <synthesis/PiperBackend.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace srtvoice
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Backend name: "openai", "elevenlabs" or "piper".
    std::string provider = "openai";

    /// @brief Job identifier; namespaces the cache and names the default output.
    std::string jobName = "default";

    std::string srtPath;

    /// @brief Output WAV path; derived from job and provider when empty.
    std::string outputPath;

    std::string cacheDir = ".cache";

    /// @brief Whether Latin-script subtitles are transliterated to Serbian Cyrillic.
    bool transliterate = true;

    bool verbose = false;

    PipelineConfig pipeline;
    OpenAiConfig openai;
    ElevenLabsConfig elevenLabs;
    PiperConfig piper;
};

/// @brief Looks up an environment variable; std::nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Overrides configuration values from TTS_*, OPENAI_TTS_*, ELEVENLABS_* and PIPER_* variables.
/// @param config The configuration to update.
/// @param lookup Environment accessor; the process environment when empty.
/// @return Success, or a ConfigError for a malformed numeric or boolean value.
[[nodiscard]] auto applyEnvironment(AppConfig& config, const EnvironmentLookup& lookup = {}) -> VoidResult;

/// @brief Checks the provider name, its output format and the pipeline settings.
[[nodiscard]] auto validateAppConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the output path, deriving `output/<job>-<provider>-voiceover.wav` when unset.
[[nodiscard]] auto resolvedOutputPath(const AppConfig& config) -> std::string;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace srtvoice
