// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <library/SegmentStore.hpp>

#include <filesystem>
#include <memory>

namespace narrator
{

/// @brief SegmentStore that keeps WAV files and a JSON index on disk.
///
/// Layout: <root>/<book>/<chapter>/segments.json, segment-NNNN.wav and
/// chapter.wav. Files are written to a temporary name and renamed into place.
class FileSegmentStore final: public SegmentStore
{
  public:
    explicit FileSegmentStore(std::filesystem::path root);
    ~FileSegmentStore() override;

    FileSegmentStore(const FileSegmentStore&) = delete;
    FileSegmentStore& operator=(const FileSegmentStore&) = delete;

    [[nodiscard]] auto putSegment(const BookId& book, const ChapterId& chapter, const Segment& segment)
        -> VoidResult override;
    [[nodiscard]] auto putSegments(const BookId& book, const ChapterId& chapter, std::span<const Segment> segments)
        -> VoidResult override;
    [[nodiscard]] auto getSegments(const BookId& book, const ChapterId& chapter)
        -> Result<std::vector<Segment>> override;
    [[nodiscard]] auto getSegment(const BookId& book, const ChapterId& chapter, int index)
        -> Result<std::optional<Segment>> override;
    [[nodiscard]] auto putChapterAudio(const BookId& book, const ChapterId& chapter, AudioHandle audio)
        -> VoidResult override;
    [[nodiscard]] auto getChapterAudio(const BookId& book, const ChapterId& chapter) -> Result<AudioHandle> override;

    /// @brief Returns the directory holding a chapter's files.
    [[nodiscard]] auto chapterDirectory(const BookId& book, const ChapterId& chapter) const -> std::filesystem::path;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
