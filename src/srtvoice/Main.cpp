// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <pipeline/TimingAssembler.hpp>
#include <srtvoice/BackendFactory.hpp>
#include <srtvoice/Config.hpp>
#include <subtitle/SrtParser.hpp>
#include <synthesis/SpeechSynthesizer.hpp>
#include <synthesis/SynthesisCache.hpp>
#include <text/Transliterator.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>

namespace
{

/// @brief Command-line overrides; unset options leave the configuration untouched.
struct CommandLine
{
    std::string configPath;
    std::optional<std::string> provider;
    std::optional<std::string> jobName;
    std::optional<std::string> srtPath;
    std::optional<std::string> outputPath;
    std::optional<std::string> model;
    std::optional<std::string> voice;
    std::optional<std::string> format;
    std::optional<std::string> cacheDir;
    std::optional<std::string> instructions;
    std::optional<std::string> forceLanguage;
    std::optional<int> padStart;
    std::optional<int> padEnd;
    std::optional<int> maxChars;
    std::optional<double> maxSpeedup;
    std::optional<int> workers;
    bool noFill = false;
    bool hardCut = false;
    bool noTransliterate = false;
    bool clearCache = false;
    bool verbose = false;
};

void applyCommandLine(const CommandLine& cli, srtvoice::AppConfig& config)
{
    if (cli.provider)
        config.provider = *cli.provider;
    if (cli.jobName)
        config.jobName = *cli.jobName;
    if (cli.srtPath)
        config.srtPath = *cli.srtPath;
    if (cli.outputPath)
        config.outputPath = *cli.outputPath;
    if (cli.cacheDir)
        config.cacheDir = *cli.cacheDir;

    // --model, --voice and --format address whichever provider is selected.
    if (config.provider == "elevenlabs")
    {
        if (cli.model)
            config.elevenLabs.modelId = *cli.model;
        if (cli.voice)
            config.elevenLabs.voiceId = *cli.voice;
        if (cli.format)
            config.elevenLabs.outputFormat = *cli.format;
    }
    else if (config.provider == "piper")
    {
        if (cli.model)
            config.piper.modelPath = *cli.model;
    }
    else
    {
        if (cli.model)
            config.openai.model = *cli.model;
        if (cli.voice)
            config.openai.voice = *cli.voice;
        if (cli.format)
            config.openai.responseFormat = *cli.format;
    }
    if (cli.instructions)
        config.openai.instructions = *cli.instructions;
    if (cli.forceLanguage)
        config.openai.forceLanguage = *cli.forceLanguage;

    if (cli.padStart)
        config.pipeline.padLeadingMs = *cli.padStart;
    if (cli.padEnd)
        config.pipeline.padTrailingMs = *cli.padEnd;
    if (cli.maxChars)
        config.pipeline.maxCharsPerCall = *cli.maxChars;
    if (cli.maxSpeedup)
        config.pipeline.maxSpeedup = *cli.maxSpeedup;
    if (cli.workers)
        config.pipeline.workerCount = *cli.workers;
    if (cli.noFill)
        config.pipeline.fillToEnd = false;
    if (cli.hardCut)
        config.pipeline.hardCut = true;
    if (cli.noTransliterate)
        config.transliterate = false;
    if (cli.verbose)
        config.verbose = true;
}

auto run(const CommandLine& cli) -> srtvoice::VoidResult
{
    using namespace srtvoice;

    auto configResult = cli.configPath.empty() ? loadConfig() : loadConfigFromFile(cli.configPath);
    if (!configResult)
        return std::unexpected(configResult.error());
    auto& config = *configResult;

    if (auto env = applyEnvironment(config); !env)
        return env;
    applyCommandLine(cli, config);

    if (config.verbose)
        log::setLevel(log::Level::Debug);

    if (auto valid = validateAppConfig(config); !valid)
        return valid;

    auto backend = createBackend(config);
    if (!backend)
        return std::unexpected(backend.error());

    auto cache = SynthesisCache(config.cacheDir, (*backend)->identity(), config.jobName, (*backend)->outputFormat());
    if (cli.clearCache)
    {
        if (auto cleared = cache.clear(); !cleared)
            return cleared;
    }

    if (config.srtPath.empty())
        return makeError(ErrorCode::ConfigError, "No subtitle file given (--srt-path or TTS_SRT_PATH)");

    auto cues = loadSrtFile(config.srtPath);
    if (!cues)
        return std::unexpected(cues.error());

    if (config.transliterate)
    {
        auto const anyCyrillic =
            std::ranges::any_of(*cues, [](const Cue& cue) { return containsCyrillic(cue.text); });
        if (!anyCyrillic)
        {
            log::info("Transliterating subtitles to Serbian Cyrillic");
            for (auto& cue: *cues)
                cue.text = toSerbianCyrillic(cue.text);
        }
    }

    auto synthesizer = SpeechSynthesizer(**backend, cache);
    auto assembler = TimingAssembler(synthesizer, config.pipeline);

    auto track = assembler.build(*cues);
    if (!track)
        return std::unexpected(track.error());

    auto const outputPath = resolvedOutputPath(config);
    auto const outputDir = std::filesystem::path(outputPath).parent_path();
    if (!outputDir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(outputDir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create output directory '{}': {}",
                                         outputDir.string(),
                                         ec.message()));
    }

    if (auto written = track->writeWav(outputPath); !written)
        return written;

    std::println("Done: {}", outputPath);
    std::println("Backend calls: {}, cache hits: {}", synthesizer.backendCalls(), synthesizer.cacheHits());
    return {};
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "srtvoice: synthesize a subtitle-timed voice-over track" };

    auto cli = CommandLine {};
    app.add_option("-c,--config", cli.configPath, "Path to config file");
    app.add_option("--provider", cli.provider, "Synthesis provider (openai|elevenlabs|piper)");
    app.add_option("--job-name", cli.jobName, "Job name; namespaces the cache");
    app.add_option("--srt-path", cli.srtPath, "Subtitle file to voice");
    app.add_option("-o,--output", cli.outputPath, "Output WAV path");
    app.add_option("--model", cli.model, "Model (OpenAI/ElevenLabs) or voice model path (piper)");
    app.add_option("--voice", cli.voice, "Voice name (OpenAI) or voice id (ElevenLabs)");
    app.add_option("--format", cli.format, "Provider audio format");
    app.add_flag("--no-fill", cli.noFill, "Do not pad short cues to the end of their slot");
    app.add_flag("--hard-cut", cli.hardCut, "Truncate overflowing cues instead of speeding them up");
    app.add_option("--pad-start", cli.padStart, "Leading silence in milliseconds");
    app.add_option("--pad-end", cli.padEnd, "Trailing silence in milliseconds");
    app.add_option("--max-chars", cli.maxChars, "Maximum characters per synthesis request");
    app.add_option("--max-speedup", cli.maxSpeedup, "Maximum playback speed-up for overflowing cues");
    app.add_option("--workers", cli.workers, "Concurrent synthesis workers");
    app.add_option("--cache-dir", cli.cacheDir, "Synthesis cache root directory");
    app.add_option("--instructions", cli.instructions, "Style instructions (OpenAI)");
    app.add_option("--force-language", cli.forceLanguage, "Language hint prefixed to the input (OpenAI)");
    app.add_flag("--no-transliterate", cli.noTransliterate, "Keep Latin-script subtitles as they are");
    app.add_flag("--clear-cache", cli.clearCache, "Delete this job's cached audio before synthesizing");
    app.add_flag("-v,--verbose", cli.verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (auto result = run(cli); !result)
    {
        srtvoice::log::error("{}", result.error().message);
        return 1;
    }
    return 0;
}
