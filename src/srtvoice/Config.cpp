// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace srtvoice
{

namespace
{

    constexpr auto KnownProviders = std::array<std::string_view, 3> { "openai", "elevenlabs", "piper" };

    constexpr auto DecodableOpenAiFormats = std::array<std::string_view, 3> { "mp3", "wav", "flac" };

    auto processEnvironment(std::string_view name) -> std::optional<std::string>
    {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    }

    auto parseBool(std::string_view name, std::string_view value) -> Result<bool>
    {
        auto lower = std::string(value);
        std::ranges::transform(
            lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
            return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off" || lower.empty())
            return false;
        return makeError(ErrorCode::ConfigError, std::format("{} is not a boolean: '{}'", name, value));
    }

    template <typename T>
    auto parseNumber(std::string_view name, std::string_view value) -> Result<T>
    {
        auto number = T {};
        auto const* const last = value.data() + value.size();
        auto const [ptr, ec] = std::from_chars(value.data(), last, number);
        if (ec != std::errc {} || ptr != last)
            return makeError(ErrorCode::ConfigError, std::format("{} is not a number: '{}'", name, value));
        return number;
    }

    auto getOptionalInt(const nlohmann::json& obj, std::string_view key) -> std::optional<int>
    {
        auto keyStr = std::string(key);
        if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
            return obj[keyStr].get<int>();
        return std::nullopt;
    }

    template <typename T>
    auto optionalToJson(const std::optional<T>& value) -> nlohmann::json
    {
        if (value)
            return *value;
        return nullptr;
    }

    /// @brief Applies one environment variable through a setter when it is set.
    class EnvironmentReader
    {
      public:
        explicit EnvironmentReader(const EnvironmentLookup& lookup): _lookup(lookup) {}

        void string(std::string_view name, std::string& target)
        {
            if (auto value = _lookup(name))
                target = std::move(*value);
        }

        void boolean(std::string_view name, bool& target)
        {
            auto value = _lookup(name);
            if (!value)
                return;
            if (auto parsed = parseBool(name, *value))
                target = *parsed;
            else if (_status)
                _status = std::unexpected(parsed.error());
        }

        template <typename T>
        void number(std::string_view name, T& target)
        {
            auto value = _lookup(name);
            if (!value)
                return;
            if (auto parsed = parseNumber<T>(name, *value))
                target = *parsed;
            else if (_status)
                _status = std::unexpected(parsed.error());
        }

        [[nodiscard]] auto status() const -> const VoidResult& { return _status; }

      private:
        const EnvironmentLookup& _lookup;
        VoidResult _status;
    };

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\srtvoice";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/srtvoice";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/srtvoice";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/srtvoice";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: expected a JSON object", path));

    auto config = AppConfig {};
    config.provider = json::getStringOr(root, "provider", config.provider);
    config.jobName = json::getStringOr(root, "jobName", config.jobName);
    config.srtPath = json::getStringOr(root, "srtPath", "");
    config.outputPath = json::getStringOr(root, "outputPath", "");
    config.cacheDir = json::getStringOr(root, "cacheDir", config.cacheDir);
    config.transliterate = json::getBoolOr(root, "transliterate", config.transliterate);
    config.verbose = json::getBoolOr(root, "verbose", config.verbose);

    // Pipeline section
    if (root.contains("pipeline"))
    {
        auto const& pipeline = root["pipeline"];
        auto& target = config.pipeline;
        target.fillToEnd = json::getBoolOr(pipeline, "fillToEnd", target.fillToEnd);
        target.hardCut = json::getBoolOr(pipeline, "hardCut", target.hardCut);
        target.padLeadingMs = json::getIntOr(pipeline, "padLeadingMs", target.padLeadingMs);
        target.padTrailingMs = json::getIntOr(pipeline, "padTrailingMs", target.padTrailingMs);
        target.maxCharsPerCall = json::getIntOr(pipeline, "maxCharsPerCall", target.maxCharsPerCall);
        target.maxSpeedup = json::getDoubleOr(pipeline, "maxSpeedup", target.maxSpeedup);
        target.sampleRate = json::getIntOr(pipeline, "sampleRate", target.sampleRate);
        target.channels = json::getIntOr(pipeline, "channels", target.channels);
        target.workerCount = json::getIntOr(pipeline, "workerCount", target.workerCount);
    }

    // OpenAI section
    if (root.contains("openai"))
    {
        auto const& openai = root["openai"];
        auto& target = config.openai;
        target.model = json::getStringOr(openai, "model", target.model);
        target.voice = json::getStringOr(openai, "voice", target.voice);
        target.responseFormat = json::getStringOr(openai, "responseFormat", target.responseFormat);
        target.instructions = json::getStringOr(openai, "instructions", "");
        target.forceLanguage = json::getStringOr(openai, "forceLanguage", "");
        target.baseUrl = json::getStringOr(openai, "baseUrl", target.baseUrl);
    }

    // ElevenLabs section
    if (root.contains("elevenlabs"))
    {
        auto const& elevenLabs = root["elevenlabs"];
        auto& target = config.elevenLabs;
        target.voiceId = json::getStringOr(elevenLabs, "voiceId", "");
        target.modelId = json::getStringOr(elevenLabs, "modelId", target.modelId);
        target.outputFormat = json::getStringOr(elevenLabs, "outputFormat", target.outputFormat);
        target.stability = json::getOptionalFloat(elevenLabs, "stability");
        target.similarityBoost = json::getOptionalFloat(elevenLabs, "similarityBoost");
        target.style = json::getOptionalFloat(elevenLabs, "style");
        target.useSpeakerBoost = json::getOptionalBool(elevenLabs, "useSpeakerBoost");
        target.baseUrl = json::getStringOr(elevenLabs, "baseUrl", target.baseUrl);
    }

    // Piper section
    if (root.contains("piper"))
    {
        auto const& piper = root["piper"];
        auto& target = config.piper;
        target.modelPath = json::getStringOr(piper, "modelPath", "");
        target.configPath = json::getStringOr(piper, "configPath", "");
        target.espeakDataPath = json::getStringOr(piper, "espeakDataPath", "");
        target.speakerId = getOptionalInt(piper, "speakerId");
        target.lengthScale = json::getOptionalFloat(piper, "lengthScale");
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["provider"] = config.provider;
    root["jobName"] = config.jobName;
    if (!config.srtPath.empty())
        root["srtPath"] = config.srtPath;
    if (!config.outputPath.empty())
        root["outputPath"] = config.outputPath;
    root["cacheDir"] = config.cacheDir;
    root["transliterate"] = config.transliterate;
    root["verbose"] = config.verbose;

    // Pipeline section
    root["pipeline"] = {
        { "fillToEnd", config.pipeline.fillToEnd },
        { "hardCut", config.pipeline.hardCut },
        { "padLeadingMs", config.pipeline.padLeadingMs },
        { "padTrailingMs", config.pipeline.padTrailingMs },
        { "maxCharsPerCall", config.pipeline.maxCharsPerCall },
        { "maxSpeedup", config.pipeline.maxSpeedup },
        { "sampleRate", config.pipeline.sampleRate },
        { "channels", config.pipeline.channels },
        { "workerCount", config.pipeline.workerCount },
    };

    // OpenAI section; API keys are only ever read from the environment.
    auto openai = nlohmann::json::object();
    openai["model"] = config.openai.model;
    openai["voice"] = config.openai.voice;
    openai["responseFormat"] = config.openai.responseFormat;
    if (!config.openai.instructions.empty())
        openai["instructions"] = config.openai.instructions;
    if (!config.openai.forceLanguage.empty())
        openai["forceLanguage"] = config.openai.forceLanguage;
    openai["baseUrl"] = config.openai.baseUrl;
    root["openai"] = std::move(openai);

    // ElevenLabs section
    auto elevenLabs = nlohmann::json::object();
    if (!config.elevenLabs.voiceId.empty())
        elevenLabs["voiceId"] = config.elevenLabs.voiceId;
    elevenLabs["modelId"] = config.elevenLabs.modelId;
    elevenLabs["outputFormat"] = config.elevenLabs.outputFormat;
    elevenLabs["stability"] = optionalToJson(config.elevenLabs.stability);
    elevenLabs["similarityBoost"] = optionalToJson(config.elevenLabs.similarityBoost);
    elevenLabs["style"] = optionalToJson(config.elevenLabs.style);
    elevenLabs["useSpeakerBoost"] = optionalToJson(config.elevenLabs.useSpeakerBoost);
    elevenLabs["baseUrl"] = config.elevenLabs.baseUrl;
    root["elevenlabs"] = std::move(elevenLabs);

    // Piper section
    auto piper = nlohmann::json::object();
    if (!config.piper.modelPath.empty())
        piper["modelPath"] = config.piper.modelPath;
    if (!config.piper.configPath.empty())
        piper["configPath"] = config.piper.configPath;
    if (!config.piper.espeakDataPath.empty())
        piper["espeakDataPath"] = config.piper.espeakDataPath;
    piper["speakerId"] = optionalToJson(config.piper.speakerId);
    piper["lengthScale"] = optionalToJson(config.piper.lengthScale);
    root["piper"] = std::move(piper);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto applyEnvironment(AppConfig& config, const EnvironmentLookup& lookup) -> VoidResult
{
    auto const effective = lookup ? lookup : EnvironmentLookup { processEnvironment };
    auto env = EnvironmentReader(effective);

    env.string("TTS_PROVIDER", config.provider);
    env.string("TTS_JOB_NAME", config.jobName);
    env.string("TTS_SRT_PATH", config.srtPath);
    env.string("TTS_OUTPUT_PATH", config.outputPath);
    env.string("TTS_CACHE_DIR", config.cacheDir);
    env.boolean("TTS_FILL_TO_END", config.pipeline.fillToEnd);
    env.boolean("TTS_HARD_CUT", config.pipeline.hardCut);
    env.number("TTS_PAD_START_MS", config.pipeline.padLeadingMs);
    env.number("TTS_PAD_END_MS", config.pipeline.padTrailingMs);
    env.number("TTS_MAX_CHARS", config.pipeline.maxCharsPerCall);
    env.number("TTS_MAX_SPEEDUP", config.pipeline.maxSpeedup);
    env.number("TTS_WORKERS", config.pipeline.workerCount);
    env.boolean("TTS_TRANSLITERATE", config.transliterate);

    env.string("OPENAI_TTS_MODEL", config.openai.model);
    env.string("OPENAI_TTS_VOICE", config.openai.voice);
    env.string("OPENAI_TTS_FORMAT", config.openai.responseFormat);
    env.string("OPENAI_TTS_INSTRUCTIONS", config.openai.instructions);
    env.string("OPENAI_TTS_FORCE_LANGUAGE", config.openai.forceLanguage);

    env.string("ELEVENLABS_VOICE_ID", config.elevenLabs.voiceId);
    env.string("ELEVENLABS_MODEL_ID", config.elevenLabs.modelId);
    env.string("ELEVENLABS_OUTPUT_FORMAT", config.elevenLabs.outputFormat);

    env.string("PIPER_MODEL_PATH", config.piper.modelPath);

    return env.status();
}

auto validateAppConfig(const AppConfig& config) -> VoidResult
{
    if (std::ranges::find(KnownProviders, config.provider) == KnownProviders.end())
        return makeError(ErrorCode::ConfigError,
                         std::format("Unknown provider '{}' (expected openai, elevenlabs or piper)", config.provider));

    if (config.jobName.empty())
        return makeError(ErrorCode::ConfigError, "Job name must not be empty");

    if (config.provider == "openai"
        && std::ranges::find(DecodableOpenAiFormats, config.openai.responseFormat) == DecodableOpenAiFormats.end())
        return makeError(ErrorCode::ConfigError,
                         std::format("OpenAI response format '{}' cannot be decoded (use mp3, wav or flac)",
                                     config.openai.responseFormat));

    if (config.provider == "elevenlabs")
    {
        if (config.elevenLabs.voiceId.empty())
            return makeError(ErrorCode::ConfigError, "ElevenLabs needs a voice id (ELEVENLABS_VOICE_ID)");
        auto const& format = config.elevenLabs.outputFormat;
        if (!format.starts_with("mp3") && !format.starts_with("wav"))
            return makeError(ErrorCode::ConfigError,
                             std::format("ElevenLabs output format '{}' cannot be decoded (use mp3_* or wav_*)",
                                         format));
    }

    if (config.provider == "piper" && config.piper.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "Piper needs a voice model path (PIPER_MODEL_PATH)");

    return validate(config.pipeline);
}

auto resolvedOutputPath(const AppConfig& config) -> std::string
{
    if (!config.outputPath.empty())
        return config.outputPath;
    return (std::filesystem::path("output") / std::format("{}-{}-voiceover.wav", config.jobName, config.provider))
        .string();
}

} // namespace srtvoice
