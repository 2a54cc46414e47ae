// SPDX-License-Identifier: Apache-2.0
#include "SegmentProgressTracker.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace narrator
{

auto ChapterProgress::percentage() const -> int
{
    if (totalSegments <= 0)
        return 0;
    return static_cast<int>(
        std::lround(static_cast<double>(generatedIndices.size()) * 100.0 / static_cast<double>(totalSegments)));
}

void SegmentProgressTracker::setListener(Listener listener)
{
    auto lock = std::lock_guard(_mutex);
    _listener = std::move(listener);
}

void SegmentProgressTracker::notify(const ChapterId& chapter, int percentage)
{
    auto listener = Listener {};
    {
        auto lock = std::lock_guard(_mutex);
        listener = _listener;
    }
    if (listener)
        listener(chapter, percentage);
}

void SegmentProgressTracker::initChapter(const ChapterId& chapter, std::span<const Segment> segments)
{
    {
        auto lock = std::lock_guard(_mutex);
        auto progress = ChapterProgress {
            .totalSegments = static_cast<int>(segments.size()),
            .isGenerating = true,
        };
        for (auto const& segment: segments)
            progress.segmentTexts.emplace(segment.index, segment.text);
        _chapters.insert_or_assign(chapter, std::move(progress));
    }
    notify(chapter, 0);
}

auto SegmentProgressTracker::markSegmentGenerated(const ChapterId& chapter, Segment segment) -> bool
{
    auto percentage = 0;
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _chapters.find(chapter);
        if (it == _chapters.end())
        {
            log::warning("Segment {} generated for untracked chapter {}", segment.index, chapter);
            return false;
        }

        auto& progress = it->second;
        if (progress.generatedIndices.contains(segment.index))
            return false;

        auto const index = segment.index;
        auto const tier = segment.qualityTier.value_or(0);
        progress.generatedIndices.insert(index);
        progress.generatedSegments.insert_or_assign(index, std::move(segment));
        auto& quality = progress.segmentQuality[index];
        quality = std::max(quality, tier);
        percentage = progress.percentage();
    }
    notify(chapter, percentage);
    return true;
}

auto SegmentProgressTracker::upgradeSegment(const ChapterId& chapter, Segment segment) -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end() || !segment.qualityTier)
        return false;

    auto& progress = it->second;
    auto const index = segment.index;
    auto const tier = *segment.qualityTier;
    auto const existing = progress.generatedSegments.find(index);
    if (existing == progress.generatedSegments.end() || existing->second.qualityTier.value_or(0) >= tier)
        return false;

    existing->second = std::move(segment);
    auto& quality = progress.segmentQuality[index];
    quality = std::max(quality, tier);
    return true;
}

void SegmentProgressTracker::markChapterComplete(const ChapterId& chapter)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _chapters.find(chapter); it != _chapters.end())
    {
        it->second.isGenerating = false;
        it->second.processingIndex = -1;
    }
}

void SegmentProgressTracker::setProcessingIndex(const ChapterId& chapter, int index)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _chapters.find(chapter); it != _chapters.end())
        it->second.processingIndex = index;
}

void SegmentProgressTracker::updateSegmentQuality(const ChapterId& chapter, int index, int tier)
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end())
        return;
    auto& quality = it->second.segmentQuality[index];
    quality = std::max(quality, tier);
}

auto SegmentProgressTracker::assignStartOffsets(const ChapterId& chapter) -> std::vector<Segment>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end())
        return {};

    auto segments = std::vector<Segment> {};
    auto offset = 0.0;
    for (auto& [index, segment]: it->second.generatedSegments)
    {
        segment.startOffsetSeconds = offset;
        offset += segment.durationSeconds.value_or(0.0);
        segments.push_back(segment);
    }
    return segments;
}

auto SegmentProgressTracker::isSegmentGenerated(const ChapterId& chapter, int index) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    return it != _chapters.end() && it->second.generatedIndices.contains(index);
}

auto SegmentProgressTracker::generatedSegment(const ChapterId& chapter, int index) const -> std::optional<Segment>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end())
        return std::nullopt;
    auto const segment = it->second.generatedSegments.find(index);
    if (segment == it->second.generatedSegments.end())
        return std::nullopt;
    return segment->second;
}

auto SegmentProgressTracker::segmentQuality(const ChapterId& chapter, int index) const -> std::optional<int>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end())
        return std::nullopt;
    auto const quality = it->second.segmentQuality.find(index);
    if (quality == it->second.segmentQuality.end())
        return std::nullopt;
    return quality->second;
}

auto SegmentProgressTracker::snapshot(const ChapterId& chapter) const -> std::optional<ChapterProgress>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    if (it == _chapters.end())
        return std::nullopt;
    return it->second;
}

auto SegmentProgressTracker::percentage(const ChapterId& chapter) const -> int
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _chapters.find(chapter);
    return it == _chapters.end() ? 0 : it->second.percentage();
}

void SegmentProgressTracker::clearChapter(const ChapterId& chapter)
{
    auto lock = std::lock_guard(_mutex);
    _chapters.erase(chapter);
}

auto SegmentProgressTracker::loadFromStore(SegmentStore& store,
                                           const BookId& book,
                                           const ChapterId& chapter,
                                           std::span<const Segment> segments) -> Result<int>
{
    auto stored = store.getSegments(book, chapter);
    if (!stored)
        return std::unexpected(stored.error());

    auto restored = 0;
    auto percentage = 0;
    {
        auto lock = std::lock_guard(_mutex);
        auto progress = ChapterProgress {
            .totalSegments = static_cast<int>(segments.size()),
            .isGenerating = true,
        };
        for (auto const& segment: segments)
            progress.segmentTexts.emplace(segment.index, segment.text);

        for (auto& segment: *stored)
        {
            auto const text = progress.segmentTexts.find(segment.index);
            if (text == progress.segmentTexts.end() || text->second != segment.text || !segment.audio)
            {
                log::debug("Ignoring stale stored segment {} of chapter {}", segment.index, chapter);
                continue;
            }
            auto const index = segment.index;
            progress.generatedIndices.insert(index);
            progress.segmentQuality.emplace(index, segment.qualityTier.value_or(0));
            progress.generatedSegments.emplace(index, std::move(segment));
            ++restored;
        }
        progress.isGenerating = restored < progress.totalSegments;
        percentage = progress.percentage();
        _chapters.insert_or_assign(chapter, std::move(progress));
    }

    if (restored > 0)
        log::info("Restored {} of {} segment(s) of chapter {} from storage", restored, segments.size(), chapter);
    notify(chapter, percentage);
    return restored;
}

} // namespace narrator
