// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSegment.hpp>
#include <core/Error.hpp>
#include <synthesis/SynthesisBackend.hpp>
#include <synthesis/SynthesisCache.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace srtvoice
{

/// @brief Bounded retry for transient backend failures.
struct RetryPolicy
{
    /// @brief Total number of backend calls per request, including the first.
    int maxAttempts = 4;

    /// @brief Delay before the second attempt; doubled for every further attempt.
    std::chrono::milliseconds initialBackoff { 1000 };

    /// @brief Upper bound for a single delay.
    std::chrono::milliseconds maxBackoff { 10000 };
};

/// @brief Turns text into decoded audio, consulting the cache before the backend.
///
/// Safe to use from several threads at once as long as the backend is.
class SpeechSynthesizer
{
  public:
    /// @brief Constructs a SpeechSynthesizer.
    /// @param backend The provider that renders uncached text.
    /// @param cache The cache namespace for this backend and job.
    /// @param retry Retry policy for transient backend failures.
    SpeechSynthesizer(SynthesisBackend& backend, SynthesisCache& cache, RetryPolicy retry = {});

    /// @brief Synthesizes text, then applies a playback speed change.
    ///
    /// A cache hit costs no backend call. A miss calls the backend with bounded retry and
    /// stores the bytes before returning. Entries that fail to decode are dropped and
    /// synthesized again.
    /// @param text The text to speak.
    /// @param speed Playback speed factor; 1.0 leaves the audio unchanged.
    /// @return The decoded audio, or SynthesisFailure/InvalidArgument.
    [[nodiscard]] auto synthesize(std::string_view text, double speed = 1.0) -> Result<AudioSegment>;

    /// @brief Returns the cache fingerprint for a text with this synthesizer's backend.
    [[nodiscard]] auto fingerprint(std::string_view text) const -> SynthesisFingerprint;

    /// @brief Returns the backend's output file extension.
    [[nodiscard]] auto outputFormat() const -> std::string { return _backend.outputFormat(); }

    /// @brief Returns the number of backend calls made so far, retries included.
    [[nodiscard]] auto backendCalls() const noexcept -> std::size_t { return _backendCalls.load(); }

    /// @brief Returns the number of requests served from the cache.
    [[nodiscard]] auto cacheHits() const noexcept -> std::size_t { return _cacheHits.load(); }

  private:
    [[nodiscard]] auto loadOrGenerate(std::string_view text) -> Result<AudioSegment>;
    [[nodiscard]] auto requestWithRetry(std::string_view text) -> Result<AudioBytes>;

    SynthesisBackend& _backend;
    SynthesisCache& _cache;
    RetryPolicy _retry;
    std::atomic<std::size_t> _backendCalls { 0 };
    std::atomic<std::size_t> _cacheHits { 0 };
};

} // namespace srtvoice
