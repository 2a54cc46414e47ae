// SPDX-License-Identifier: Apache-2.0
#include "WavFormat.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <string_view>

namespace narrator
{

namespace
{

    constexpr auto RiffHeaderSize = std::size_t { 12 };
    constexpr auto ChunkHeaderSize = std::size_t { 8 };
    constexpr auto FmtChunkSize = std::uint32_t { 16 };

    auto readLE16(std::span<const std::uint8_t> bytes, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
    }

    auto readLE32(std::span<const std::uint8_t> bytes, std::size_t offset) -> std::uint32_t
    {
        return static_cast<std::uint32_t>(bytes[offset]) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
               | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
               | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
    }

    auto tagEquals(std::span<const std::uint8_t> bytes, std::size_t offset, std::string_view tag) -> bool
    {
        return std::memcmp(bytes.data() + offset, tag.data(), 4) == 0;
    }

    void writeLE16(std::vector<std::uint8_t>& out, std::uint16_t v)
    {
        out.push_back(static_cast<std::uint8_t>(v & 0xFF));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }

    void writeLE32(std::vector<std::uint8_t>& out, std::uint32_t v)
    {
        for (auto shift = 0; shift < 32; shift += 8)
            out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
    }

    void writeTag(std::vector<std::uint8_t>& out, std::string_view tag)
    {
        out.insert(out.end(), tag.begin(), tag.end());
    }

    void writeHeader(std::vector<std::uint8_t>& out, const WavInfo& info, std::uint32_t dataSize)
    {
        auto const blockAlign = static_cast<std::uint16_t>(info.bytesPerFrame());
        auto const byteRate = info.sampleRate * blockAlign;

        writeTag(out, "RIFF");
        writeLE32(out, 4 + (ChunkHeaderSize + FmtChunkSize) + (ChunkHeaderSize + dataSize));
        writeTag(out, "WAVE");

        writeTag(out, "fmt ");
        writeLE32(out, FmtChunkSize);
        writeLE16(out, static_cast<std::uint16_t>(info.encoding));
        writeLE16(out, info.channels);
        writeLE32(out, info.sampleRate);
        writeLE32(out, byteRate);
        writeLE16(out, blockAlign);
        writeLE16(out, info.bitsPerSample);

        writeTag(out, "data");
        writeLE32(out, dataSize);
    }

} // namespace

auto parseWavHeader(std::span<const std::uint8_t> bytes) -> Result<WavInfo>
{
    if (bytes.size() < RiffHeaderSize || !tagEquals(bytes, 0, "RIFF") || !tagEquals(bytes, 8, "WAVE"))
        return makeError(ErrorCode::AudioError, "Not a RIFF/WAVE buffer");

    auto info = WavInfo {};
    auto haveFormat = false;
    auto offset = RiffHeaderSize;

    while (offset + ChunkHeaderSize <= bytes.size())
    {
        auto const chunkSize = static_cast<std::size_t>(readLE32(bytes, offset + 4));
        auto const body = offset + ChunkHeaderSize;

        if (tagEquals(bytes, offset, "fmt "))
        {
            if (chunkSize < FmtChunkSize || body + FmtChunkSize > bytes.size())
                return makeError(ErrorCode::AudioError, "Truncated WAV fmt chunk");
            info.encoding = static_cast<WavEncoding>(readLE16(bytes, body));
            info.channels = readLE16(bytes, body + 2);
            info.sampleRate = readLE32(bytes, body + 4);
            info.bitsPerSample = readLE16(bytes, body + 14);
            haveFormat = true;
        }
        else if (tagEquals(bytes, offset, "data"))
        {
            if (!haveFormat)
                return makeError(ErrorCode::AudioError, "WAV data chunk precedes fmt chunk");
            info.dataOffset = body;
            // Streaming writers leave the size unset; clamp to what is actually there.
            info.dataSize = std::min(chunkSize, bytes.size() - body);
            break;
        }

        // Chunks are padded to an even size.
        offset = body + chunkSize + (chunkSize & 1u);
    }

    if (!haveFormat || info.dataOffset == 0)
        return makeError(ErrorCode::AudioError, "WAV buffer lacks fmt or data chunk");
    if (info.encoding != WavEncoding::Pcm && info.encoding != WavEncoding::IeeeFloat)
        return makeError(ErrorCode::AudioError,
                         std::format("Unsupported WAV encoding {}", static_cast<int>(info.encoding)));
    if (info.channels == 0 || info.sampleRate == 0 || info.bitsPerSample == 0)
        return makeError(ErrorCode::AudioError, "WAV header has zero channels, rate or sample width");

    return info;
}

auto encodeWav16(std::span<const float> samples, std::uint32_t sampleRate, std::uint16_t channels)
    -> std::vector<std::uint8_t>
{
    auto const info = WavInfo {
        .encoding = WavEncoding::Pcm,
        .sampleRate = sampleRate,
        .channels = channels,
        .bitsPerSample = 16,
    };
    auto const dataSize = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));

    auto out = std::vector<std::uint8_t> {};
    out.reserve(RiffHeaderSize + 2 * ChunkHeaderSize + FmtChunkSize + dataSize);
    writeHeader(out, info, dataSize);

    for (auto const sample: samples)
    {
        auto const clamped = std::clamp(sample, -1.0f, 1.0f);
        writeLE16(out, static_cast<std::uint16_t>(static_cast<std::int16_t>(std::lround(clamped * 32767.0f))));
    }
    return out;
}

auto decodeMonoSamples(std::span<const std::uint8_t> bytes) -> Result<std::vector<float>>
{
    auto info = parseWavHeader(bytes);
    if (!info)
        return std::unexpected(info.error());

    auto const bytesPerSample = info->bitsPerSample / 8u;
    auto const isFloat = info->encoding == WavEncoding::IeeeFloat;
    if ((isFloat && bytesPerSample != 4) || bytesPerSample == 0 || bytesPerSample > 4)
        return makeError(ErrorCode::AudioError, std::format("Unsupported sample width {} bits", info->bitsPerSample));

    auto const data = bytes.subspan(info->dataOffset, info->dataSize);
    auto const frames = info->frameCount();
    auto const channels = info->channels;

    auto decodeOne = [&](std::size_t offset) -> float {
        if (isFloat)
        {
            auto const raw = readLE32(data, offset);
            auto value = 0.0f;
            std::memcpy(&value, &raw, sizeof(value));
            return value;
        }
        switch (bytesPerSample)
        {
            case 1: return (static_cast<float>(data[offset]) - 128.0f) / 128.0f;
            case 2: return static_cast<float>(static_cast<std::int16_t>(readLE16(data, offset))) / 32768.0f;
            case 3: {
                auto const raw = static_cast<std::int32_t>(static_cast<std::uint32_t>(data[offset]) << 8
                                                           | static_cast<std::uint32_t>(data[offset + 1]) << 16
                                                           | static_cast<std::uint32_t>(data[offset + 2]) << 24);
                return static_cast<float>(raw >> 8) / 8388608.0f;
            }
            default: return static_cast<float>(static_cast<std::int32_t>(readLE32(data, offset))) / 2147483648.0f;
        }
    };

    auto samples = std::vector<float>(frames);
    for (auto frame = std::size_t { 0 }; frame < frames; ++frame)
    {
        auto sum = 0.0f;
        for (auto channel = 0u; channel < channels; ++channel)
            sum += decodeOne((frame * channels + channel) * bytesPerSample);
        samples[frame] = sum / static_cast<float>(channels);
    }
    return samples;
}

auto concatenateWav(std::span<const std::span<const std::uint8_t>> clips) -> Result<std::vector<std::uint8_t>>
{
    if (clips.empty())
        return makeError(ErrorCode::InvalidArgument, "No WAV clips to concatenate");

    auto infos = std::vector<WavInfo> {};
    infos.reserve(clips.size());
    auto totalData = std::size_t { 0 };

    for (auto const& clip: clips)
    {
        auto info = parseWavHeader(clip);
        if (!info)
            return std::unexpected(info.error());

        auto const& first = infos.empty() ? *info : infos.front();
        if (info->encoding != first.encoding || info->sampleRate != first.sampleRate
            || info->channels != first.channels || info->bitsPerSample != first.bitsPerSample)
            return makeError(ErrorCode::AudioError,
                             std::format("WAV format mismatch: {} Hz/{} ch vs {} Hz/{} ch",
                                         info->sampleRate,
                                         info->channels,
                                         first.sampleRate,
                                         first.channels));

        totalData += info->dataSize;
        infos.push_back(*info);
    }

    auto out = std::vector<std::uint8_t> {};
    out.reserve(RiffHeaderSize + 2 * ChunkHeaderSize + FmtChunkSize + totalData);
    writeHeader(out, infos.front(), static_cast<std::uint32_t>(totalData));

    for (auto i = std::size_t { 0 }; i < clips.size(); ++i)
    {
        auto const data = clips[i].subspan(infos[i].dataOffset, infos[i].dataSize);
        out.insert(out.end(), data.begin(), data.end());
    }
    return out;
}

} // namespace narrator
