// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace srtvoice
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ParseError,
    DecodeError,
    AudioError,
    CacheIoError,
    TransientSynthesisError,
    FatalSynthesisError,
    SynthesisFailure,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::AudioError: return "AudioError";
        case ErrorCode::CacheIoError: return "CacheIoError";
        case ErrorCode::TransientSynthesisError: return "TransientSynthesisError";
        case ErrorCode::FatalSynthesisError: return "FatalSynthesisError";
        case ErrorCode::SynthesisFailure: return "SynthesisFailure";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace srtvoice

template <>
struct std::formatter<srtvoice::Error>: std::formatter<std::string>
{
    auto format(const srtvoice::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", srtvoice::errorCodeName(error.code), error.message), ctx);
    }
};
