// SPDX-License-Identifier: Apache-2.0
#include <srtvoice/BackendFactory.hpp>
#include <srtvoice/Config.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <iterator>
#include <map>

using namespace srtvoice;

namespace
{

auto fakeEnvironment(std::map<std::string, std::string> values) -> EnvironmentLookup
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        if (auto it = values.find(std::string(name)); it != values.end())
            return it->second;
        return std::nullopt;
    };
}

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.provider == "openai");
    CHECK(config.jobName == "default");
    CHECK(config.cacheDir == ".cache");
    CHECK(config.transliterate);
    CHECK(config.openai.model == "gpt-4o-mini-tts");
    CHECK(config.openai.voice == "alloy");
    CHECK(config.openai.responseFormat == "mp3");
    CHECK(config.pipeline.maxSpeedup == 1.15);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const dir = test::TempDirectory("config");
    auto const path = dir.path() / "config.json";
    {
        auto file = std::ofstream(path);
        file << R"({
            "provider": "elevenlabs",
            "jobName": "episode-1",
            "srtPath": "/tmp/episode.srt",
            "cacheDir": "/tmp/cache",
            "transliterate": false,
            "pipeline": {
                "fillToEnd": false,
                "hardCut": true,
                "padLeadingMs": 250,
                "padTrailingMs": 750,
                "maxCharsPerCall": 1000,
                "maxSpeedup": 1.3,
                "workerCount": 2
            },
            "openai": {
                "voice": "nova",
                "instructions": "Warm tone."
            },
            "elevenlabs": {
                "voiceId": "voice-1",
                "outputFormat": "mp3_22050_32",
                "stability": 0.4,
                "useSpeakerBoost": true
            },
            "piper": {
                "modelPath": "/models/sr.onnx",
                "speakerId": 3
            }
        })";
    }

    auto result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Top-level settings")
    {
        CHECK(config.provider == "elevenlabs");
        CHECK(config.jobName == "episode-1");
        CHECK(config.srtPath == "/tmp/episode.srt");
        CHECK(config.cacheDir == "/tmp/cache");
        CHECK_FALSE(config.transliterate);
    }

    SECTION("Pipeline settings")
    {
        CHECK_FALSE(config.pipeline.fillToEnd);
        CHECK(config.pipeline.hardCut);
        CHECK(config.pipeline.padLeadingMs == 250);
        CHECK(config.pipeline.padTrailingMs == 750);
        CHECK(config.pipeline.maxCharsPerCall == 1000);
        CHECK(config.pipeline.maxSpeedup == 1.3);
        CHECK(config.pipeline.workerCount == 2);
        CHECK(config.pipeline.sampleRate == 24000);
    }

    SECTION("Provider settings")
    {
        CHECK(config.openai.voice == "nova");
        CHECK(config.openai.model == "gpt-4o-mini-tts");
        CHECK(config.openai.instructions == "Warm tone.");
        CHECK(config.elevenLabs.voiceId == "voice-1");
        CHECK(config.elevenLabs.outputFormat == "mp3_22050_32");
        CHECK(config.elevenLabs.stability == 0.4f);
        CHECK_FALSE(config.elevenLabs.style.has_value());
        CHECK(config.elevenLabs.useSpeakerBoost == true);
        CHECK(config.piper.modelPath == "/models/sr.onnx");
        CHECK(config.piper.speakerId == 3);
        CHECK_FALSE(config.piper.lengthScale.has_value());
    }
}

TEST_CASE("loadConfigFromFile fails on missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile fails on malformed JSON", "[config]")
{
    auto const dir = test::TempDirectory("config");
    auto const path = dir.path() / "config.json";
    {
        auto file = std::ofstream(path);
        file << "{ not json";
    }

    auto result = loadConfigFromFile(path.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile and loadConfigFromFile preserve settings", "[config]")
{
    auto const dir = test::TempDirectory("config");
    auto const path = dir.path() / "nested" / "config.json";

    auto original = AppConfig {};
    original.provider = "piper";
    original.jobName = "saved";
    original.pipeline.padLeadingMs = 100;
    original.pipeline.maxSpeedup = 1.25;
    original.openai.forceLanguage = "sr";
    original.openai.apiKey = "must-not-be-saved";
    original.elevenLabs.similarityBoost = 0.75f;
    original.piper.modelPath = "/models/voice.onnx";
    original.piper.lengthScale = 1.1f;

    REQUIRE(saveConfigToFile(path.string(), original).has_value());

    auto file = std::ifstream(path);
    auto const content = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    CHECK(content.find("must-not-be-saved") == std::string::npos);

    auto loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->provider == "piper");
    CHECK(loaded->jobName == "saved");
    CHECK(loaded->pipeline.padLeadingMs == 100);
    CHECK(loaded->pipeline.maxSpeedup == 1.25);
    CHECK(loaded->openai.forceLanguage == "sr");
    CHECK(loaded->openai.apiKey.empty());
    CHECK(loaded->elevenLabs.similarityBoost == 0.75f);
    CHECK_FALSE(loaded->elevenLabs.stability.has_value());
    CHECK(loaded->piper.modelPath == "/models/voice.onnx");
    CHECK(loaded->piper.lengthScale == 1.1f);
}

TEST_CASE("applyEnvironment overrides configuration values", "[config]")
{
    auto config = AppConfig {};
    auto const env = fakeEnvironment({
        { "TTS_PROVIDER", "elevenlabs" },
        { "TTS_JOB_NAME", "from-env" },
        { "TTS_FILL_TO_END", "no" },
        { "TTS_HARD_CUT", "Yes" },
        { "TTS_PAD_START_MS", "300" },
        { "TTS_MAX_SPEEDUP", "1.4" },
        { "TTS_TRANSLITERATE", "0" },
        { "OPENAI_TTS_VOICE", "shimmer" },
        { "ELEVENLABS_VOICE_ID", "abc" },
        { "PIPER_MODEL_PATH", "/models/p.onnx" },
    });

    REQUIRE(applyEnvironment(config, env).has_value());
    CHECK(config.provider == "elevenlabs");
    CHECK(config.jobName == "from-env");
    CHECK_FALSE(config.pipeline.fillToEnd);
    CHECK(config.pipeline.hardCut);
    CHECK(config.pipeline.padLeadingMs == 300);
    CHECK(config.pipeline.maxSpeedup == 1.4);
    CHECK_FALSE(config.transliterate);
    CHECK(config.openai.voice == "shimmer");
    CHECK(config.elevenLabs.voiceId == "abc");
    CHECK(config.piper.modelPath == "/models/p.onnx");

    // Untouched values keep their defaults.
    CHECK(config.cacheDir == ".cache");
    CHECK(config.pipeline.maxCharsPerCall == 4000);
}

TEST_CASE("applyEnvironment rejects malformed values", "[config]")
{
    auto config = AppConfig {};

    auto const badNumber = applyEnvironment(config, fakeEnvironment({ { "TTS_MAX_CHARS", "lots" } }));
    REQUIRE_FALSE(badNumber.has_value());
    CHECK(badNumber.error().code == ErrorCode::ConfigError);
    CHECK(badNumber.error().message.find("TTS_MAX_CHARS") != std::string::npos);

    auto const badBool = applyEnvironment(config, fakeEnvironment({ { "TTS_HARD_CUT", "maybe" } }));
    REQUIRE_FALSE(badBool.has_value());
    CHECK(badBool.error().code == ErrorCode::ConfigError);
}

TEST_CASE("validateAppConfig checks provider settings", "[config]")
{
    auto config = AppConfig {};
    CHECK(validateAppConfig(config).has_value());

    SECTION("Unknown provider")
    {
        config.provider = "google";
        CHECK_FALSE(validateAppConfig(config).has_value());
    }

    SECTION("Undecodable OpenAI format")
    {
        config.openai.responseFormat = "opus";
        CHECK_FALSE(validateAppConfig(config).has_value());
    }

    SECTION("ElevenLabs without a voice")
    {
        config.provider = "elevenlabs";
        CHECK_FALSE(validateAppConfig(config).has_value());
        config.elevenLabs.voiceId = "voice-1";
        CHECK(validateAppConfig(config).has_value());
        config.elevenLabs.outputFormat = "pcm_16000";
        CHECK_FALSE(validateAppConfig(config).has_value());
    }

    SECTION("Piper without a model")
    {
        config.provider = "piper";
        CHECK_FALSE(validateAppConfig(config).has_value());
    }

    SECTION("Invalid pipeline settings")
    {
        config.pipeline.maxSpeedup = 0.5;
        CHECK_FALSE(validateAppConfig(config).has_value());
    }
}

TEST_CASE("resolvedOutputPath derives a default from job and provider", "[config]")
{
    auto config = AppConfig {};
    config.jobName = "ep1";
    CHECK(resolvedOutputPath(config) == "output/ep1-openai-voiceover.wav");

    config.outputPath = "/tmp/out.wav";
    CHECK(resolvedOutputPath(config) == "/tmp/out.wav");
}

TEST_CASE("createBackend selects the provider and reads the API key", "[config]")
{
    auto config = AppConfig {};
    auto const env = fakeEnvironment({ { "OPENAI_API_KEY", "test-key" } });

    auto openai = createBackend(config, env);
    REQUIRE(openai.has_value());
    CHECK((*openai)->identity() == "openai");
    CHECK((*openai)->outputFormat() == "mp3");

    config.provider = "elevenlabs";
    config.elevenLabs.voiceId = "voice-1";
    auto elevenLabs = createBackend(config, env);
    REQUIRE(elevenLabs.has_value());
    CHECK((*elevenLabs)->identity() == "elevenlabs");

    config.provider = "unknown";
    auto unknown = createBackend(config, env);
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ConfigError);
}
