// SPDX-License-Identifier: Apache-2.0
#include "SpeechSynthesizer.hpp"

#include <core/Log.hpp>
#include <text/TextChunker.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace srtvoice
{

SpeechSynthesizer::SpeechSynthesizer(SynthesisBackend& backend, SynthesisCache& cache, RetryPolicy retry):
    _backend(backend), _cache(cache), _retry(retry)
{
}

auto SpeechSynthesizer::fingerprint(std::string_view text) const -> SynthesisFingerprint
{
    return SynthesisFingerprint {
        .backend = _backend.identity(),
        .config = _backend.configFingerprint(),
        .text = std::string(text),
    };
}

auto SpeechSynthesizer::synthesize(std::string_view text, double speed) -> Result<AudioSegment>
{
    if (!(speed > 0.0))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Playback speed must be greater than zero (got {})", speed));

    auto segment = loadOrGenerate(text);
    if (!segment)
        return segment;

    return segment->withSpeed(speed);
}

auto SpeechSynthesizer::loadOrGenerate(std::string_view text) -> Result<AudioSegment>
{
    auto const fp = fingerprint(text);

    if (auto cached = _cache.get(fp))
    {
        auto decoded = AudioSegment::decode(*cached);
        if (decoded)
        {
            ++_cacheHits;
            log::debug("Cache hit for \"{}\"", textPreview(text));
            return decoded;
        }
        log::warning("Dropping undecodable cache entry for \"{}\": {}", textPreview(text), decoded.error().message);
        _cache.remove(fp);
    }

    auto bytes = requestWithRetry(text);
    if (!bytes)
        return std::unexpected(bytes.error());

    auto decoded = AudioSegment::decode(*bytes);
    if (!decoded)
        return makeError(ErrorCode::SynthesisFailure,
                         std::format("{} returned audio that cannot be decoded: {}",
                                     _backend.identity(),
                                     decoded.error().message));

    _cache.put(fp, *bytes);
    return decoded;
}

auto SpeechSynthesizer::requestWithRetry(std::string_view text) -> Result<AudioBytes>
{
    auto const attempts = std::max(_retry.maxAttempts, 1);
    auto lastError = Error {};

    for (auto attempt = 1; attempt <= attempts; ++attempt)
    {
        if (attempt > 1)
        {
            auto const doubled = _retry.initialBackoff * (1LL << std::min(attempt - 2, 30));
            auto const delay = std::min<std::chrono::milliseconds>(doubled, _retry.maxBackoff);
            if (delay.count() > 0)
                std::this_thread::sleep_for(delay);
        }

        ++_backendCalls;
        auto bytes = _backend.synthesize(text);
        if (bytes)
        {
            log::debug("{} synthesized \"{}\" ({} bytes, attempt {})",
                       _backend.identity(),
                       textPreview(text),
                       bytes->size(),
                       attempt);
            return bytes;
        }

        lastError = bytes.error();
        if (lastError.code != ErrorCode::TransientSynthesisError)
            return makeError(ErrorCode::SynthesisFailure,
                             std::format("{} rejected the request: {}", _backend.identity(), lastError.message));

        log::warning("{} attempt {}/{} failed: {}", _backend.identity(), attempt, attempts, lastError.message);
    }

    return makeError(ErrorCode::SynthesisFailure,
                     std::format("{} failed after {} attempts: {}", _backend.identity(), attempts, lastError.message));
}

} // namespace srtvoice
