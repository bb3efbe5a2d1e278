// SPDX-License-Identifier: Apache-2.0
#include "PiperBackend.hpp"

#include <audio/AudioSegment.hpp>
#include <core/Log.hpp>

#include <filesystem>
#include <format>
#include <memory>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace srtvoice
{

namespace
{

    /// @brief Piper output: float32 PCM, mono.
    constexpr auto PiperChannels = 1u;

} // namespace

PiperBackend::PiperBackend(ConstructionKey, PiperConfig config, piper_synthesizer* synth):
    _config(std::move(config)), _synth(synth)
{
}

PiperBackend::~PiperBackend()
{
    if (_synth)
        piper_free(_synth);
}

auto PiperBackend::create(PiperConfig config) -> Result<std::unique_ptr<PiperBackend>>
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::FatalSynthesisError, "No piper voice model configured");

    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(config.modelPath, ec))
        return makeError(ErrorCode::FatalSynthesisError,
                         std::format("Piper voice model not found: {}", config.modelPath));

    if (config.configPath.empty())
        config.configPath = config.modelPath + ".json";

    auto const espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    auto* synth = piper_create(config.modelPath.c_str(), config.configPath.c_str(), espeakData.c_str());
    if (!synth)
        return makeError(ErrorCode::FatalSynthesisError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     config.configPath,
                                     espeakData));

    log::info("Piper voice loaded (model: {}, espeak: {})", config.modelPath, espeakData);
    return std::make_unique<PiperBackend>(ConstructionKey {}, std::move(config), synth);
}

auto PiperBackend::configFingerprint() const -> nlohmann::json
{
    return nlohmann::json {
        { "model", _config.modelPath },
        { "speakerId", _config.speakerId ? nlohmann::json(*_config.speakerId) : nlohmann::json(nullptr) },
        { "lengthScale", _config.lengthScale ? nlohmann::json(*_config.lengthScale) : nlohmann::json(nullptr) },
    };
}

auto PiperBackend::synthesize(std::string_view text) -> Result<AudioBytes>
{
    auto lock = std::lock_guard(_mutex);

    auto opts = piper_default_synthesize_options(_synth);
    if (_config.speakerId)
        opts.speaker_id = *_config.speakerId;
    if (_config.lengthScale)
        opts.length_scale = *_config.lengthScale;

    auto const input = std::string(text);
    auto const startResult = piper_synthesize_start(_synth, input.c_str(), &opts);
    if (startResult != PIPER_OK)
        return makeError(ErrorCode::FatalSynthesisError,
                         std::format("piper_synthesize_start failed ({})", startResult));

    auto audioData = std::vector<float> {};
    auto sampleRate = 0;
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        auto const rc = piper_synthesize_next(_synth, &chunk);
        if (rc == PIPER_DONE)
            break;
        if (rc != PIPER_OK)
            return makeError(ErrorCode::FatalSynthesisError, std::format("piper_synthesize_next failed ({})", rc));

        sampleRate = chunk.sample_rate;
        audioData.insert(audioData.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    if (sampleRate <= 0)
        return makeError(ErrorCode::FatalSynthesisError, "piper produced no audio");

    return AudioSegment(static_cast<unsigned>(sampleRate), PiperChannels, std::move(audioData)).encodeWav();
}

} // namespace srtvoice
