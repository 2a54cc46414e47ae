// SPDX-License-Identifier: Apache-2.0
#include "Error.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace narrator
{

namespace
{

    struct ErrorPattern
    {
        std::string_view needle;
        ErrorCode code;
    };

    // Matched case-insensitively against the engine's message, first match wins.
    constexpr auto TransientPatterns = std::array<ErrorPattern, 13> { {
        { "failed to allocate", ErrorCode::OutOfMemory },
        { "can't create a session", ErrorCode::OutOfMemory },
        { "out of memory", ErrorCode::OutOfMemory },
        { "aborted()", ErrorCode::OutOfMemory },
        { "timeout", ErrorCode::TimeoutError },
        { "etimedout", ErrorCode::TimeoutError },
        { "rate limit", ErrorCode::RateLimited },
        { "too many requests", ErrorCode::RateLimited },
        { "network", ErrorCode::NetworkError },
        { "econnrefused", ErrorCode::NetworkError },
        { "enotfound", ErrorCode::NetworkError },
        { "service unavailable", ErrorCode::NetworkError },
        { "temporarily unavailable", ErrorCode::NetworkError },
    } };

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

} // namespace

auto normalizeEngineError(Error error, std::string_view context) -> Error
{
    if (!context.empty())
        error.message = std::format("{}: {}", context, error.message);

    if (error.code != ErrorCode::EngineError && error.code != ErrorCode::Unknown)
        return error;

    auto const lowered = toLower(error.message);
    for (auto const& pattern: TransientPatterns)
    {
        if (lowered.find(pattern.needle) != std::string::npos)
        {
            error.code = pattern.code;
            return error;
        }
    }

    error.code = ErrorCode::InvalidInput;
    return error;
}

} // namespace narrator
