// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace srtvoice
{

/// @brief Everything that determines a backend's output for one request.
struct SynthesisFingerprint
{
    std::string backend;
    nlohmann::json config;
    std::string text;

    /// @brief Returns the canonical serialization that is hashed into the cache key.
    ///
    /// The requested speed is fixed at the 1.0 baseline since speed changes are applied
    /// to decoded audio after the cache.
    [[nodiscard]] auto canonical() const -> std::string;

    /// @brief Returns the SHA-1 hex digest of canonical().
    [[nodiscard]] auto key() const -> Result<std::string>;
};

/// @brief Durable, content-addressed store of synthesized audio bytes.
///
/// Entries live at `<root>/<backend>/<job>/<sha1>.<extension>`. Writes go to a unique
/// temporary file which is then renamed into place, so a reader never observes a
/// partial entry and concurrent writers of the same key may race freely.
/// IO failures are logged and reported as misses; they are never fatal.
class SynthesisCache
{
  public:
    /// @brief Constructs a cache namespace.
    /// @param root The cache root directory.
    /// @param backendIdentity Provider identity, first namespace level.
    /// @param jobName Caller-supplied job identifier, second namespace level.
    /// @param extension File extension of the stored audio.
    SynthesisCache(std::filesystem::path root,
                   std::string_view backendIdentity,
                   std::string_view jobName,
                   std::string extension);

    /// @brief Looks up the audio for a fingerprint.
    /// @return The stored bytes, or std::nullopt on a miss, an empty entry or an IO error.
    [[nodiscard]] auto get(const SynthesisFingerprint& fingerprint) const -> std::optional<AudioBytes>;

    /// @brief Stores the audio for a fingerprint. Failures are logged and ignored.
    void put(const SynthesisFingerprint& fingerprint, std::span<const std::uint8_t> bytes);

    /// @brief Removes the entry for a fingerprint, e.g. after it failed to decode.
    void remove(const SynthesisFingerprint& fingerprint);

    /// @brief Returns true if an entry exists for the fingerprint.
    [[nodiscard]] auto contains(const SynthesisFingerprint& fingerprint) const -> bool;

    /// @brief Removes every entry of this backend/job namespace.
    [[nodiscard]] auto clear() -> VoidResult;

    /// @brief Returns the namespace directory.
    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return _directory; }

    /// @brief Returns the entry path for a fingerprint.
    [[nodiscard]] auto entryPath(const SynthesisFingerprint& fingerprint) const -> Result<std::filesystem::path>;

  private:
    std::filesystem::path _directory;
    std::string _extension;
};

} // namespace srtvoice
