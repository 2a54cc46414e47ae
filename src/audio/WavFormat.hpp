// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace narrator
{

/// @brief WAVE format tags understood by the parser.
enum class WavEncoding : std::uint16_t
{
    Pcm = 1,
    IeeeFloat = 3,
};

/// @brief Layout of a RIFF/WAVE byte buffer.
struct WavInfo
{
    WavEncoding encoding = WavEncoding::Pcm;
    std::uint32_t sampleRate = 0;
    std::uint16_t channels = 0;
    std::uint16_t bitsPerSample = 0;
    std::size_t dataOffset = 0; ///< Byte offset of the first sample.
    std::size_t dataSize = 0;   ///< Size of the sample data in bytes.

    [[nodiscard]] auto bytesPerFrame() const -> std::size_t { return channels * (bitsPerSample / 8u); }

    [[nodiscard]] auto frameCount() const -> std::size_t
    {
        return bytesPerFrame() == 0 ? 0 : dataSize / bytesPerFrame();
    }

    [[nodiscard]] auto durationSeconds() const -> double
    {
        return sampleRate == 0 ? 0.0 : static_cast<double>(frameCount()) / sampleRate;
    }
};

/// @brief Parses the header chunks of a WAV buffer.
/// @param bytes The complete file contents.
/// @return The format description or an AudioError.
[[nodiscard]] auto parseWavHeader(std::span<const std::uint8_t> bytes) -> Result<WavInfo>;

/// @brief Encodes float samples in [-1, 1] as a 16-bit PCM WAV file.
/// @param samples Interleaved samples.
/// @param sampleRate Sample rate in Hz.
/// @param channels Channel count.
[[nodiscard]] auto encodeWav16(std::span<const float> samples, std::uint32_t sampleRate, std::uint16_t channels = 1)
    -> std::vector<std::uint8_t>;

/// @brief Decodes a WAV buffer into mono float samples, averaging channels.
/// @param bytes The complete file contents (8/16/24/32-bit PCM or 32-bit float).
/// @return The samples or an AudioError.
[[nodiscard]] auto decodeMonoSamples(std::span<const std::uint8_t> bytes) -> Result<std::vector<float>>;

/// @brief Joins WAV buffers of identical format into a single WAV buffer.
/// @param clips The buffers to join, in playback order.
/// @return The joined file or an AudioError if the formats differ.
[[nodiscard]] auto concatenateWav(std::span<const std::span<const std::uint8_t>> clips)
    -> Result<std::vector<std::uint8_t>>;

} // namespace narrator
