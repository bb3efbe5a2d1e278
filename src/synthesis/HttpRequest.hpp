// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace srtvoice
{

/// @brief A JSON POST request performed by the curl executable.
struct HttpRequest
{
    std::string url;

    /// @brief Header lines ("Name: value"). Passed to curl through a file, never on its command line.
    std::vector<std::string> headers;

    std::string body;
    std::chrono::seconds timeout { 120 };
};

/// @brief Status and raw body of a completed HTTP exchange.
struct HttpResponse
{
    int status = 0;
    AudioBytes body;

    [[nodiscard]] auto ok() const noexcept -> bool { return status >= 200 && status < 300; }

    /// @brief Returns the body as text, truncated for use in error messages.
    [[nodiscard]] auto bodyExcerpt(std::size_t maxLength = 300) const -> std::string;
};

/// @brief Returns true for curl exit codes caused by the network rather than the request.
[[nodiscard]] auto isTransientCurlExitCode(int exitCode) noexcept -> bool;

/// @brief Returns true for HTTP statuses worth retrying (408, 409, 429 and 5xx).
[[nodiscard]] auto isTransientHttpStatus(int status) noexcept -> bool;

/// @brief Creates a new directory readable only by the current user.
/// @param parent The directory to create it in.
/// @param prefix Name prefix; a random suffix is appended. An existing directory is never reused.
/// @return The new directory, or FatalSynthesisError if it cannot be created.
[[nodiscard]] auto createPrivateDirectory(const std::filesystem::path& parent, std::string_view prefix)
    -> Result<std::filesystem::path>;

/// @brief Performs the request by spawning curl.
/// @param request The request.
/// @return The response for any HTTP status, TransientSynthesisError for network failures,
///         or FatalSynthesisError if curl cannot run or rejects its arguments.
[[nodiscard]] auto performHttpRequest(const HttpRequest& request) -> Result<HttpResponse>;

/// @brief Converts a non-2xx response into a transient or fatal synthesis error.
/// @param provider The provider name for the message.
/// @param response The failed response.
[[nodiscard]] auto httpFailure(std::string_view provider, const HttpResponse& response) -> Error;

} // namespace srtvoice
