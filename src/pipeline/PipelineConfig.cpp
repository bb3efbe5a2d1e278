// SPDX-License-Identifier: Apache-2.0
#include "PipelineConfig.hpp"

#include <cmath>
#include <format>

namespace srtvoice
{

namespace
{

    constexpr auto MinSampleRate = 8000;
    constexpr auto MaxSampleRate = 192000;
    constexpr auto MaxWorkers = 32;

} // namespace

auto validate(const PipelineConfig& config) -> VoidResult
{
    if (!std::isfinite(config.maxSpeedup) || config.maxSpeedup < 1.0)
        return makeError(ErrorCode::ConfigError, std::format("maxSpeedup must be >= 1.0 (got {})", config.maxSpeedup));

    if (config.padLeadingMs < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("padLeadingMs must not be negative (got {})", config.padLeadingMs));

    if (config.padTrailingMs < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("padTrailingMs must not be negative (got {})", config.padTrailingMs));

    if (config.maxCharsPerCall < 1)
        return makeError(ErrorCode::ConfigError,
                         std::format("maxCharsPerCall must be at least 1 (got {})", config.maxCharsPerCall));

    if (config.sampleRate < MinSampleRate || config.sampleRate > MaxSampleRate)
        return makeError(ErrorCode::ConfigError,
                         std::format("sampleRate must be within {}..{} Hz (got {})",
                                     MinSampleRate,
                                     MaxSampleRate,
                                     config.sampleRate));

    if (config.channels < 1 || config.channels > 2)
        return makeError(ErrorCode::ConfigError, std::format("channels must be 1 or 2 (got {})", config.channels));

    if (config.workerCount < 1 || config.workerCount > MaxWorkers)
        return makeError(ErrorCode::ConfigError,
                         std::format("workerCount must be within 1..{} (got {})", MaxWorkers, config.workerCount));

    return {};
}

} // namespace srtvoice
