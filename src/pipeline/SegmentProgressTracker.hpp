// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <library/SegmentStore.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace narrator
{

/// @brief Generation state of one chapter.
struct ChapterProgress
{
    int totalSegments = 0;
    std::set<int> generatedIndices;
    std::map<int, std::string> segmentTexts;
    std::map<int, Segment> generatedSegments;
    std::map<int, int> segmentQuality;
    bool isGenerating = false;
    int processingIndex = -1; ///< Segment currently dispatched by the fast pass, or -1.

    /// @brief Returns the generated share in whole percent.
    [[nodiscard]] auto percentage() const -> int;
};

/// @brief Thread-safe registry of ChapterProgress records.
///
/// First generations are recorded set-if-absent and upgrades replace-if-higher,
/// so the quality of a segment never decreases.
class SegmentProgressTracker
{
  public:
    /// @brief Receives the chapter id and its new percentage after every change.
    using Listener = std::function<void(const ChapterId& chapter, int percentage)>;

    void setListener(Listener listener);

    /// @brief Starts tracking a chapter about to be generated, replacing any earlier record.
    void initChapter(const ChapterId& chapter, std::span<const Segment> segments);

    /// @brief Records the first generation of a segment.
    /// @return False if the segment was already generated or the chapter is not tracked.
    auto markSegmentGenerated(const ChapterId& chapter, Segment segment) -> bool;

    /// @brief Replaces a generated segment with a higher-tier version.
    /// @return False unless @p segment has a higher tier than the recorded one.
    auto upgradeSegment(const ChapterId& chapter, Segment segment) -> bool;

    void markChapterComplete(const ChapterId& chapter);
    void setProcessingIndex(const ChapterId& chapter, int index);

    /// @brief Raises the recorded quality of a segment; lower tiers are ignored.
    void updateSegmentQuality(const ChapterId& chapter, int index, int tier);

    /// @brief Assigns cumulative start offsets in index order.
    /// @return The generated segments with their offsets.
    auto assignStartOffsets(const ChapterId& chapter) -> std::vector<Segment>;

    [[nodiscard]] auto isSegmentGenerated(const ChapterId& chapter, int index) const -> bool;
    [[nodiscard]] auto generatedSegment(const ChapterId& chapter, int index) const -> std::optional<Segment>;
    [[nodiscard]] auto segmentQuality(const ChapterId& chapter, int index) const -> std::optional<int>;
    [[nodiscard]] auto snapshot(const ChapterId& chapter) const -> std::optional<ChapterProgress>;
    [[nodiscard]] auto percentage(const ChapterId& chapter) const -> int;

    /// @brief Forgets a chapter and releases its audio.
    void clearChapter(const ChapterId& chapter);

    /// @brief Starts tracking @p segments and hydrates them from previously stored audio.
    ///
    /// Stored segments whose index or text no longer matches @p segments are
    /// ignored. Segments missing from the store stay pending.
    /// @return The number of segments restored from storage.
    [[nodiscard]] auto loadFromStore(SegmentStore& store,
                                     const BookId& book,
                                     const ChapterId& chapter,
                                     std::span<const Segment> segments) -> Result<int>;

  private:
    void notify(const ChapterId& chapter, int percentage);

    mutable std::mutex _mutex;
    std::map<ChapterId, ChapterProgress> _chapters;
    Listener _listener;
};

} // namespace narrator
