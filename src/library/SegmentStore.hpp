// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace narrator
{

/// @brief Persistent storage of generated audio, keyed by (book, chapter, segment index).
///
/// Implementations must be safe to call from several threads.
class SegmentStore
{
  public:
    virtual ~SegmentStore() = default;

    /// @brief Stores a generated segment, replacing any previous version of the same index.
    /// @param segment A segment with audio.
    [[nodiscard]] virtual auto putSegment(const BookId& book, const ChapterId& chapter, const Segment& segment)
        -> VoidResult = 0;

    /// @brief Stores several segments at once.
    [[nodiscard]] virtual auto putSegments(const BookId& book,
                                           const ChapterId& chapter,
                                           std::span<const Segment> segments) -> VoidResult
    {
        for (auto const& segment: segments)
            if (auto result = putSegment(book, chapter, segment); !result)
                return result;
        return {};
    }

    /// @brief Returns every stored segment of a chapter, ordered by index (empty if none).
    [[nodiscard]] virtual auto getSegments(const BookId& book, const ChapterId& chapter)
        -> Result<std::vector<Segment>> = 0;

    /// @brief Returns one stored segment, or std::nullopt if it was never stored.
    [[nodiscard]] virtual auto getSegment(const BookId& book, const ChapterId& chapter, int index)
        -> Result<std::optional<Segment>> = 0;

    /// @brief Stores the assembled audio of a whole chapter.
    [[nodiscard]] virtual auto putChapterAudio(const BookId& book, const ChapterId& chapter, AudioHandle audio)
        -> VoidResult = 0;

    /// @brief Returns the assembled chapter audio, or a NotFound error.
    [[nodiscard]] virtual auto getChapterAudio(const BookId& book, const ChapterId& chapter)
        -> Result<AudioHandle> = 0;
};

} // namespace narrator
