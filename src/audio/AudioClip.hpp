// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/WavFormat.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace narrator
{

/// @brief An immutable generated audio buffer (a WAV file held in memory).
struct AudioClip
{
    std::vector<std::uint8_t> bytes;
    WavInfo format;

    [[nodiscard]] auto durationSeconds() const -> double { return format.durationSeconds(); }

    /// @brief Returns the raw sample bytes without the header.
    [[nodiscard]] auto samples() const -> std::span<const std::uint8_t>
    {
        return std::span(bytes).subspan(format.dataOffset, format.dataSize);
    }
};

/// @brief Shared, read-only handle to a clip.
///
/// Every holder (progress record, buffer window, audio output) owns one
/// reference; the clip is released when the last holder drops its handle.
using AudioHandle = std::shared_ptr<const AudioClip>;

/// @brief Wraps WAV bytes in a clip, validating the header.
/// @param bytes The complete WAV file.
/// @return The handle or an AudioError for malformed input.
[[nodiscard]] inline auto makeAudioClip(std::vector<std::uint8_t> bytes) -> Result<AudioHandle>
{
    auto format = parseWavHeader(bytes);
    if (!format)
        return std::unexpected(format.error());
    return std::make_shared<const AudioClip>(AudioClip { .bytes = std::move(bytes), .format = *format });
}

} // namespace narrator
