// SPDX-License-Identifier: Apache-2.0
#include "SynthesisCache.hpp"

#include <core/Hash.hpp>
#include <core/Log.hpp>

#include <atomic>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

namespace srtvoice
{

namespace
{

    /// @brief Makes a namespace component safe to use as a directory name.
    auto sanitizeComponent(std::string_view name) -> std::string
    {
        auto result = std::string {};
        for (auto const c: name)
        {
            auto const safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-'
                              || c == '_' || c == '.';
            result += safe ? c : '_';
        }
        if (result.empty() || result == "." || result == "..")
            return "default";
        return result;
    }

    auto temporarySuffix() -> std::string
    {
        static auto counter = std::atomic<std::uint64_t> { 0 };
        return std::format(".tmp-{}-{}",
                           std::hash<std::thread::id> {}(std::this_thread::get_id()),
                           counter.fetch_add(1, std::memory_order_relaxed));
    }

} // namespace

auto SynthesisFingerprint::canonical() const -> std::string
{
    // nlohmann::json objects keep their keys sorted, so dump() is canonical.
    auto const object = nlohmann::json {
        { "backend", backend },
        { "config", config },
        { "speed", 1.0 },
        { "text", text },
    };
    return object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto SynthesisFingerprint::key() const -> Result<std::string>
{
    return sha1Hex(canonical());
}

SynthesisCache::SynthesisCache(std::filesystem::path root,
                               std::string_view backendIdentity,
                               std::string_view jobName,
                               std::string extension):
    _directory(std::move(root) / sanitizeComponent(backendIdentity) / sanitizeComponent(jobName)),
    _extension(std::move(extension))
{
}

auto SynthesisCache::entryPath(const SynthesisFingerprint& fingerprint) const -> Result<std::filesystem::path>
{
    auto key = fingerprint.key();
    if (!key)
        return std::unexpected(key.error());
    return _directory / std::format("{}.{}", *key, _extension);
}

auto SynthesisCache::get(const SynthesisFingerprint& fingerprint) const -> std::optional<AudioBytes>
{
    auto const path = entryPath(fingerprint);
    if (!path)
    {
        log::warning("Cache lookup skipped: {}", path.error().message);
        return std::nullopt;
    }

    auto ec = std::error_code {};
    if (!std::filesystem::exists(*path, ec))
        return std::nullopt;

    auto file = std::ifstream(*path, std::ios::binary);
    if (!file.is_open())
    {
        log::warning("Cache entry {} exists but cannot be opened, treating as miss", path->string());
        return std::nullopt;
    }

    auto bytes = AudioBytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char> {});
    if (file.bad())
    {
        log::warning("Failed reading cache entry {}, treating as miss", path->string());
        return std::nullopt;
    }

    if (bytes.empty())
    {
        log::warning("Cache entry {} is empty, treating as miss", path->string());
        return std::nullopt;
    }

    log::trace("Cache hit: {}", path->string());
    return bytes;
}

void SynthesisCache::put(const SynthesisFingerprint& fingerprint, std::span<const std::uint8_t> bytes)
{
    auto const path = entryPath(fingerprint);
    if (!path)
    {
        log::warning("Cache write skipped: {}", path.error().message);
        return;
    }

    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
    {
        log::warning("Cannot create cache directory '{}': {}", _directory.string(), ec.message());
        return;
    }

    auto temporary = *path;
    temporary += temporarySuffix();

    {
        auto file = std::ofstream(temporary, std::ios::binary | std::ios::trunc);
        if (file.is_open())
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file.is_open() || !file)
        {
            log::warning("Failed writing cache entry {}", temporary.string());
            std::filesystem::remove(temporary, ec);
            return;
        }
    }

    std::filesystem::rename(temporary, *path, ec);
    if (ec)
    {
        log::warning("Failed committing cache entry {}: {}", path->string(), ec.message());
        std::filesystem::remove(temporary, ec);
        return;
    }

    log::trace("Cached {} bytes at {}", bytes.size(), path->string());
}

void SynthesisCache::remove(const SynthesisFingerprint& fingerprint)
{
    auto const path = entryPath(fingerprint);
    if (!path)
        return;

    auto ec = std::error_code {};
    std::filesystem::remove(*path, ec);
    if (ec)
        log::warning("Failed removing cache entry {}: {}", path->string(), ec.message());
}

auto SynthesisCache::contains(const SynthesisFingerprint& fingerprint) const -> bool
{
    auto const path = entryPath(fingerprint);
    auto ec = std::error_code {};
    return path && std::filesystem::exists(*path, ec);
}

auto SynthesisCache::clear() -> VoidResult
{
    auto ec = std::error_code {};
    auto const removed = std::filesystem::remove_all(_directory, ec);
    if (ec)
        return makeError(ErrorCode::CacheIoError,
                         std::format("Failed to clear cache directory '{}': {}", _directory.string(), ec.message()));

    log::info("Cleared {} cache files from {}", removed, _directory.string());
    return {};
}

} // namespace srtvoice
