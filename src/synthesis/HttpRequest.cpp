// SPDX-License-Identifier: Apache-2.0
#include "HttpRequest.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

#include <sys/wait.h>

#include <fcntl.h>
#include <spawn.h>
#include <stdlib.h>
#include <unistd.h>

extern char** environ;

namespace srtvoice
{

namespace
{

    /// @brief Private scratch directory for one request, removed on destruction.
    struct ScratchDirectory
    {
        std::filesystem::path path;

        explicit ScratchDirectory(std::filesystem::path directory): path(std::move(directory)) {}

        ~ScratchDirectory()
        {
            auto ec = std::error_code {};
            std::filesystem::remove_all(path, ec);
        }

        ScratchDirectory(const ScratchDirectory&) = delete;
        ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    };

    auto writeFile(const std::filesystem::path& path, std::string_view content) -> bool
    {
        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return false;
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return static_cast<bool>(file);
    }

    struct ProcessResult
    {
        int exitCode = -1;
        std::string standardOutput;
    };

    /// @brief Spawns a process, collects its stdout and waits for it to exit.
    auto runProcess(std::vector<std::string> args) -> Result<ProcessResult>
    {
        // Close-on-exec so concurrently spawned processes do not inherit each other's pipes.
        int stdoutPipe[2];
        if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
            return makeError(ErrorCode::FatalSynthesisError, "Failed to create stdout pipe");

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);

        auto argv = std::vector<char*> {};
        for (auto& arg: args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        pid_t pid;
        auto const status = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        ::close(stdoutPipe[1]);

        if (status != 0)
        {
            ::close(stdoutPipe[0]);
            return makeError(ErrorCode::FatalSynthesisError,
                             std::format("Failed to spawn '{}': {}", args.front(), strerror(status)));
        }

        auto result = ProcessResult {};
        auto buf = std::array<char, 4096> {};
        while (true)
        {
            auto const bytesRead = ::read(stdoutPipe[0], buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;
            result.standardOutput.append(buf.data(), static_cast<size_t>(bytesRead));
        }
        ::close(stdoutPipe[0]);

        int waitStatus = 0;
        while (waitpid(pid, &waitStatus, 0) < 0)
        {
            if (errno != EINTR)
                return makeError(ErrorCode::FatalSynthesisError,
                                 std::format("Failed waiting for '{}': {}", args.front(), strerror(errno)));
        }

        result.exitCode = WIFEXITED(waitStatus) ? WEXITSTATUS(waitStatus) : -1;
        return result;
    }

} // namespace

auto HttpResponse::bodyExcerpt(std::size_t maxLength) const -> std::string
{
    auto const length = static_cast<std::ptrdiff_t>(std::min(body.size(), maxLength));
    auto text = std::string(body.begin(), body.begin() + length);
    for (auto& c: text)
    {
        if (c == '\n' || c == '\r')
            c = ' ';
    }
    if (body.size() > maxLength)
        text += "...";
    return text;
}

auto isTransientCurlExitCode(int exitCode) noexcept -> bool
{
    switch (exitCode)
    {
        case 5:  // couldn't resolve proxy
        case 6:  // couldn't resolve host
        case 7:  // failed to connect
        case 16: // HTTP/2 framing layer
        case 18: // partial transfer
        case 28: // operation timed out
        case 35: // TLS handshake failed
        case 52: // empty reply
        case 55: // send failure
        case 56: // receive failure
        case 92: // HTTP/2 stream error
            return true;
        default: return false;
    }
}

auto isTransientHttpStatus(int status) noexcept -> bool
{
    return status == 408 || status == 409 || status == 429 || status >= 500;
}

auto createPrivateDirectory(const std::filesystem::path& parent, std::string_view prefix)
    -> Result<std::filesystem::path>
{
    // mkdtemp picks an unused name and creates the directory with mode 0700 in one step.
    auto pattern = (parent / std::format("{}-XXXXXX", prefix)).string();
    if (!::mkdtemp(pattern.data()))
        return makeError(ErrorCode::FatalSynthesisError,
                         std::format("Cannot create private directory in '{}': {}",
                                     parent.string(),
                                     std::strerror(errno)));
    return std::filesystem::path(pattern);
}

auto performHttpRequest(const HttpRequest& request) -> Result<HttpResponse>
{
    auto ec = std::error_code {};
    auto const temporaryRoot = std::filesystem::temp_directory_path(ec);
    if (ec)
        return makeError(ErrorCode::FatalSynthesisError,
                         std::format("No temporary directory for HTTP request files: {}", ec.message()));

    // The header file carries the API key.
    auto directory = createPrivateDirectory(temporaryRoot, "srtvoice-http");
    if (!directory)
        return std::unexpected(directory.error());
    auto const scratch = ScratchDirectory(std::move(*directory));

    auto const headersPath = scratch.path / "headers";
    auto const bodyPath = scratch.path / "request";
    auto const outputPath = scratch.path / "response";

    auto headerText = std::string {};
    for (auto const& header: request.headers)
        headerText += header + "\n";

    if (!writeFile(headersPath, headerText) || !writeFile(bodyPath, request.body))
        return makeError(ErrorCode::FatalSynthesisError, "Cannot write HTTP request files");

    auto process = runProcess({
        "curl",
        "--silent",
        "--show-error",
        "--request",
        "POST",
        "--max-time",
        std::to_string(request.timeout.count()),
        "--header",
        "@" + headersPath.string(),
        "--data-binary",
        "@" + bodyPath.string(),
        "--output",
        outputPath.string(),
        "--write-out",
        "%{http_code}",
        request.url,
    });
    if (!process)
        return std::unexpected(process.error());

    if (process->exitCode != 0)
    {
        auto const code = isTransientCurlExitCode(process->exitCode) ? ErrorCode::TransientSynthesisError
                                                                     : ErrorCode::FatalSynthesisError;
        return makeError(code, std::format("curl exited with code {} for {}", process->exitCode, request.url));
    }

    auto response = HttpResponse {};
    auto const& statusText = process->standardOutput;
    auto const* const statusEnd = statusText.data() + statusText.size();
    auto const [ptr, parseError] = std::from_chars(statusText.data(), statusEnd, response.status);
    if (parseError != std::errc {})
        return makeError(ErrorCode::TransientSynthesisError,
                         std::format("curl reported no HTTP status for {}", request.url));

    auto file = std::ifstream(outputPath, std::ios::binary);
    if (file.is_open())
        response.body.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char> {});

    log::trace("POST {} -> HTTP {} ({} bytes)", request.url, response.status, response.body.size());
    return response;
}

auto httpFailure(std::string_view provider, const HttpResponse& response) -> Error
{
    auto const code = isTransientHttpStatus(response.status) ? ErrorCode::TransientSynthesisError
                                                             : ErrorCode::FatalSynthesisError;
    return Error { code, std::format("{} returned HTTP {}: {}", provider, response.status, response.bodyExcerpt()) };
}

} // namespace srtvoice
