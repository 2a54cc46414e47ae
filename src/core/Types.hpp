// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioClip.hpp>

#include <compare>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace narrator
{

using BookId = std::string;
using ChapterId = std::string;

/// @brief A chapter as handed over by the document parsing subsystem.
struct Chapter
{
    ChapterId id;
    std::string title;
    std::string text;
};

/// @brief Identifies one segment of one chapter.
struct SegmentKey
{
    ChapterId chapterId;
    int index = 0;

    auto operator<=>(const SegmentKey&) const = default;
};

/// @brief One unit of speakable text within a chapter.
///
/// Text and index never change after splitting. Audio, timing and quality are
/// filled in once the segment has been generated.
struct Segment
{
    int index = 0;
    std::string text;
    AudioHandle audio;                        ///< Null until generated (or after release).
    std::optional<double> durationSeconds;    ///< Known once audio exists.
    std::optional<double> startOffsetSeconds; ///< Offset from the chapter start.
    std::optional<int> qualityTier;           ///< Tier the audio was generated at.
};

/// @brief Speech engine configuration of one quality tier.
struct TierConfig
{
    std::string engine;          ///< Engine identity, e.g. "piper".
    std::string voice;           ///< Voice key understood by the engine.
    std::string modelPath;       ///< Model file backing the voice.
    std::string quantization;    ///< Precision/quantization label, e.g. "fp16".
    std::string device = "cpu";  ///< Execution device.
    float lengthScale = 1.0f;    ///< Speaking-rate factor passed to the engine.

    auto operator==(const TierConfig&) const -> bool = default;
};

} // namespace narrator

template <>
struct std::formatter<narrator::SegmentKey>: std::formatter<std::string>
{
    auto format(const narrator::SegmentKey& key, auto& ctx) const
    {
        return std::formatter<std::string>::format(std::format("{}#{}", key.chapterId, key.index), ctx);
    }
};
