// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <synthesis/SynthesisBackend.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct piper_synthesizer;

namespace srtvoice
{

/// @brief Settings for local synthesis with a piper voice.
struct PiperConfig
{
    /// @brief Path to the piper voice model (.onnx file).
    std::string modelPath;

    /// @brief Path to the voice config; defaults to modelPath + ".json".
    std::string configPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;

    /// @brief Speaker of a multi-speaker voice; the voice default when unset.
    std::optional<int> speakerId;

    /// @brief Phoneme length scale (larger is slower); the voice default when unset.
    std::optional<float> lengthScale;
};

/// @brief Synthesizes speech locally using the piper library (linked at build time).
///
/// The piper synthesizer is not reentrant, so concurrent synthesize() calls are serialized.
class PiperBackend: public SynthesisBackend
{
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

  public:
    /// @brief Reachable only from create(), which owns the ConstructionKey.
    PiperBackend(ConstructionKey, PiperConfig config, piper_synthesizer* synth);
    ~PiperBackend() override;

    PiperBackend(const PiperBackend&) = delete;
    PiperBackend& operator=(const PiperBackend&) = delete;

    /// @brief Loads a piper voice.
    /// @param config The voice configuration.
    /// @return The backend, or a FatalSynthesisError if the voice cannot be loaded.
    [[nodiscard]] static auto create(PiperConfig config) -> Result<std::unique_ptr<PiperBackend>>;

    [[nodiscard]] auto identity() const -> std::string override { return "piper"; }
    [[nodiscard]] auto outputFormat() const -> std::string override { return "wav"; }
    [[nodiscard]] auto configFingerprint() const -> nlohmann::json override;
    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioBytes> override;

  private:
    PiperConfig _config;
    piper_synthesizer* _synth = nullptr;
    std::mutex _mutex;
};

} // namespace srtvoice
