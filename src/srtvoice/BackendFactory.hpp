// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <srtvoice/Config.hpp>
#include <synthesis/SynthesisBackend.hpp>

#include <memory>

namespace srtvoice
{

/// @brief Creates the synthesis backend selected by `config.provider`.
///
/// API keys are taken from OPENAI_API_KEY and ELEVENLABS_API_KEY unless already set in the
/// configuration. A missing key is not an error here; the backend reports it on first use.
/// @param config The application configuration.
/// @param lookup Environment accessor; the process environment when empty.
/// @return The backend, or a ConfigError for an unknown provider, or the piper load error.
[[nodiscard]] auto createBackend(const AppConfig& config, const EnvironmentLookup& lookup = {})
    -> Result<std::unique_ptr<SynthesisBackend>>;

} // namespace srtvoice
