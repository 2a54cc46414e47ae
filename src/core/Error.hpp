// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace narrator
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    StorageError,
    AudioError,
    EngineError,
    ModelLoadError,
    NetworkError,
    RateLimited,
    OutOfMemory,
    InvalidInput,
    UnsupportedVoice,
    QueueFull,
    TimeoutError,
    Cancelled,
    NotFound,
};

/// @brief Retry classification of an error.
enum class ErrorKind : std::uint8_t
{
    Transient,    ///< Worth retrying after a backoff delay.
    Permanent,    ///< Retrying will not help.
    Timeout,      ///< Transient, produced by an exceeded time budget.
    Cancellation, ///< Stopped on purpose; never retried.
};

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

/// @brief Returns the retry classification of an error code.
[[nodiscard]] constexpr auto errorKind(ErrorCode code) -> ErrorKind
{
    switch (code)
    {
        case ErrorCode::NetworkError:
        case ErrorCode::RateLimited:
        case ErrorCode::OutOfMemory:
        case ErrorCode::QueueFull: return ErrorKind::Transient;
        case ErrorCode::TimeoutError: return ErrorKind::Timeout;
        case ErrorCode::Cancelled: return ErrorKind::Cancellation;
        default: return ErrorKind::Permanent;
    }
}

/// @brief Returns true if an operation failing with @p error may succeed when retried.
[[nodiscard]] constexpr auto isRetryable(const Error& error) -> bool
{
    auto const kind = errorKind(error.code);
    return kind == ErrorKind::Transient || kind == ErrorKind::Timeout;
}

/// @brief Returns true for failures that indicate an exhausted or corrupted engine context.
[[nodiscard]] constexpr auto isMemoryError(const Error& error) -> bool
{
    return error.code == ErrorCode::OutOfMemory;
}

/// @brief Converts an ErrorKind to its string representation.
[[nodiscard]] constexpr auto errorKindToString(ErrorKind kind) -> std::string_view
{
    switch (kind)
    {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancellation: return "cancellation";
    }
    return "unknown";
}

/// @brief Maps a raw engine failure onto the error taxonomy.
///
/// Errors that already carry a specific code are returned unchanged. Generic
/// EngineError / Unknown failures are classified by matching their message
/// against known transient patterns and default to InvalidInput (permanent).
/// @param error The raw error reported by a speech engine.
/// @param context Optional prefix describing the failed operation.
/// @return The normalized error.
[[nodiscard]] auto normalizeEngineError(Error error, std::string_view context = {}) -> Error;

} // namespace narrator

template <>
struct std::formatter<narrator::Error>: std::formatter<std::string>
{
    auto format(const narrator::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}/{}] {}",
                        static_cast<int>(error.code),
                        narrator::errorKindToString(narrator::errorKind(error.code)),
                        error.message),
            ctx);
    }
};
