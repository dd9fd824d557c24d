// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Error codes for categorizing failures across the application.
///
/// The first group is the user-facing failure taxonomy of the transcription core,
/// the second group covers ambient failures (configuration, I/O, bad arguments).
enum class ErrorCode
{
    Unknown,

    EngineNotFound,
    EngineLoadFailed,
    OsVersionIncompatible,
    LibraryMissing,
    ModelCorrupted,
    Cancelled,
    TranscriptionFailed,

    InvalidArgument,
    IoError,
    ConfigError,
};

/// @brief Represents an error with a code, an actionable message and optional context.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;

    /// Human-readable, category-specific message.
    std::string message;

    /// Raw text reported by the native layer, if any.
    std::string originalMessage;

    std::string audioPath;
    std::string modelPath;
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Wraps a fully populated Error into an unexpected value.
[[nodiscard]] inline auto makeError(Error error) -> std::unexpected<Error>
{
    return std::unexpected<Error>(std::move(error));
}

/// @brief Returns a stable identifier for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::EngineNotFound: return "EngineNotFound";
        case ErrorCode::EngineLoadFailed: return "EngineLoadFailed";
        case ErrorCode::OsVersionIncompatible: return "OSVersionIncompatible";
        case ErrorCode::LibraryMissing: return "LibraryMissing";
        case ErrorCode::ModelCorrupted: return "ModelCorrupted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TranscriptionFailed: return "TranscriptionFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

/// @brief Returns true if the error represents a deliberate cancellation rather than a failure.
[[nodiscard]] inline auto isCancellation(const Error& error) -> bool
{
    return error.code == ErrorCode::Cancelled;
}

} // namespace xcaption

template <>
struct std::formatter<xcaption::Error>: std::formatter<std::string>
{
    auto format(const xcaption::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", xcaption::errorCodeName(error.code), error.message), ctx);
    }
};
