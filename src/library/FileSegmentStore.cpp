// SPDX-License-Identifier: Apache-2.0
#include "FileSegmentStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

namespace narrator
{

namespace
{

    constexpr auto IndexFileName = "segments.json";
    constexpr auto ChapterAudioFileName = "chapter.wav";
    constexpr auto IndexVersion = 1;

    /// @brief Maps an identifier onto a single safe path component.
    auto pathComponent(std::string_view id) -> std::string
    {
        auto out = std::string {};
        out.reserve(id.size());
        for (auto const c: id)
        {
            auto const uc = static_cast<unsigned char>(c);
            out.push_back(std::isalnum(uc) || c == '-' || c == '_' || c == '.' ? c : '_');
        }
        if (out.empty() || out == "." || out == "..")
            out = "_";
        return out;
    }

    auto segmentFileName(int index) -> std::string
    {
        return std::format("segment-{:04}.wav", index);
    }

    auto writeFileAtomically(const std::filesystem::path& path, std::span<const std::uint8_t> bytes) -> VoidResult
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::StorageError,
                             std::format("Cannot create directory {}: {}", path.parent_path().string(), ec.message()));

        auto tmp = path;
        tmp += ".tmp";
        {
            auto file = std::ofstream(tmp, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
                return makeError(ErrorCode::StorageError, std::format("Cannot write {}", tmp.string()));
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!file)
                return makeError(ErrorCode::StorageError, std::format("Short write to {}", tmp.string()));
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec)
            return makeError(ErrorCode::StorageError,
                             std::format("Cannot rename {} to {}: {}", tmp.string(), path.string(), ec.message()));
        return {};
    }

    auto readFile(const std::filesystem::path& path) -> Result<std::vector<std::uint8_t>>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::NotFound, std::format("Cannot open {}", path.string()));
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char> {});
    }

    auto segmentToJson(const Segment& segment) -> nlohmann::json
    {
        auto entry = nlohmann::json {
            { "index", segment.index },
            { "text", segment.text },
            { "file", segmentFileName(segment.index) },
        };
        if (segment.durationSeconds)
            entry["durationSeconds"] = *segment.durationSeconds;
        if (segment.startOffsetSeconds)
            entry["startOffsetSeconds"] = *segment.startOffsetSeconds;
        if (segment.qualityTier)
            entry["qualityTier"] = *segment.qualityTier;
        return entry;
    }

} // namespace

struct FileSegmentStore::Impl
{
    std::filesystem::path root;
    std::mutex mutex;

    [[nodiscard]] auto chapterDir(const BookId& book, const ChapterId& chapter) const -> std::filesystem::path
    {
        return root / pathComponent(book) / pathComponent(chapter);
    }

    auto loadIndex(const std::filesystem::path& dir) -> Result<nlohmann::json>
    {
        auto const path = dir / IndexFileName;
        if (!std::filesystem::exists(path))
            return nlohmann::json { { "version", IndexVersion }, { "segments", nlohmann::json::array() } };

        auto index = json::parseFile(path);
        if (!index)
            return makeError(ErrorCode::StorageError, std::format("Corrupt segment index {}: {}", path.string(), index.error().message));
        if (!index->contains("segments") || !(*index)["segments"].is_array())
            (*index)["segments"] = nlohmann::json::array();
        return index;
    }

    auto saveIndex(const std::filesystem::path& dir, const nlohmann::json& index) -> VoidResult
    {
        auto const text = index.dump(2);
        return writeFileAtomically(dir / IndexFileName,
                                   std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    }

    /// @brief Writes the segment's WAV and upserts its index entry. Requires the lock.
    auto storeSegment(const std::filesystem::path& dir, nlohmann::json& index, const Segment& segment) -> VoidResult
    {
        if (!segment.audio)
            return makeError(ErrorCode::InvalidArgument, std::format("Segment {} has no audio", segment.index));

        if (auto written = writeFileAtomically(dir / segmentFileName(segment.index), segment.audio->bytes); !written)
            return written;

        auto& entries = index["segments"].get_ref<nlohmann::json::array_t&>();
        auto const it = std::ranges::find_if(
            entries, [&](const nlohmann::json& e) { return json::getIntOr(e, "index", -1) == segment.index; });
        if (it != entries.end())
            *it = segmentToJson(segment);
        else
            entries.push_back(segmentToJson(segment));
        return {};
    }

    auto loadSegment(const std::filesystem::path& dir, const nlohmann::json& entry) -> Result<Segment>
    {
        auto const index = json::getIntOr(entry, "index", -1);
        if (index < 0)
            return makeError(ErrorCode::StorageError, "Segment index entry without index");

        auto const file = json::getStringOr(entry, "file", segmentFileName(index));
        return readFile(dir / pathComponent(file)).and_then(makeAudioClip).transform([&](AudioHandle audio) {
            auto segment = Segment {
                .index = index,
                .text = json::getStringOr(entry, "text", ""),
                .audio = std::move(audio),
            };
            segment.durationSeconds = entry.contains("durationSeconds")
                                          ? std::optional(json::getDoubleOr(entry, "durationSeconds", 0.0))
                                          : std::optional(segment.audio->durationSeconds());
            if (entry.contains("startOffsetSeconds"))
                segment.startOffsetSeconds = json::getDoubleOr(entry, "startOffsetSeconds", 0.0);
            if (entry.contains("qualityTier"))
                segment.qualityTier = json::getIntOr(entry, "qualityTier", 0);
            return segment;
        });
    }
};

FileSegmentStore::FileSegmentStore(std::filesystem::path root): _impl(std::make_unique<Impl>())
{
    _impl->root = std::move(root);
}

FileSegmentStore::~FileSegmentStore() = default;

auto FileSegmentStore::chapterDirectory(const BookId& book, const ChapterId& chapter) const -> std::filesystem::path
{
    return _impl->chapterDir(book, chapter);
}

auto FileSegmentStore::putSegment(const BookId& book, const ChapterId& chapter, const Segment& segment) -> VoidResult
{
    return putSegments(book, chapter, std::span(&segment, 1));
}

auto FileSegmentStore::putSegments(const BookId& book, const ChapterId& chapter, std::span<const Segment> segments)
    -> VoidResult
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const dir = _impl->chapterDir(book, chapter);
    auto index = _impl->loadIndex(dir);
    if (!index)
        return std::unexpected(index.error());

    for (auto const& segment: segments)
        if (auto stored = _impl->storeSegment(dir, *index, segment); !stored)
            return stored;

    std::ranges::sort((*index)["segments"].get_ref<nlohmann::json::array_t&>(),
                      {},
                      [](const nlohmann::json& e) { return json::getIntOr(e, "index", -1); });
    log::trace("Stored {} segment(s) of {}/{}", segments.size(), book, chapter);
    return _impl->saveIndex(dir, *index);
}

auto FileSegmentStore::getSegments(const BookId& book, const ChapterId& chapter) -> Result<std::vector<Segment>>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const dir = _impl->chapterDir(book, chapter);
    auto index = _impl->loadIndex(dir);
    if (!index)
        return std::unexpected(index.error());

    auto segments = std::vector<Segment> {};
    for (auto const& entry: (*index)["segments"])
    {
        auto segment = _impl->loadSegment(dir, entry);
        if (!segment)
        {
            log::warning("Skipping unreadable stored segment in {}: {}", dir.string(), segment.error().message);
            continue;
        }
        segments.push_back(std::move(*segment));
    }
    std::ranges::sort(segments, {}, &Segment::index);
    return segments;
}

auto FileSegmentStore::getSegment(const BookId& book, const ChapterId& chapter, int index)
    -> Result<std::optional<Segment>>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const dir = _impl->chapterDir(book, chapter);
    auto loaded = _impl->loadIndex(dir);
    if (!loaded)
        return std::unexpected(loaded.error());

    for (auto const& entry: (*loaded)["segments"])
    {
        if (json::getIntOr(entry, "index", -1) != index)
            continue;
        return _impl->loadSegment(dir, entry).transform([](Segment s) { return std::optional(std::move(s)); });
    }
    return std::optional<Segment> {};
}

auto FileSegmentStore::putChapterAudio(const BookId& book, const ChapterId& chapter, AudioHandle audio) -> VoidResult
{
    if (!audio)
        return makeError(ErrorCode::InvalidArgument, "Chapter audio is empty");

    auto lock = std::lock_guard(_impl->mutex);
    return writeFileAtomically(_impl->chapterDir(book, chapter) / ChapterAudioFileName, audio->bytes);
}

auto FileSegmentStore::getChapterAudio(const BookId& book, const ChapterId& chapter) -> Result<AudioHandle>
{
    auto lock = std::lock_guard(_impl->mutex);
    return readFile(_impl->chapterDir(book, chapter) / ChapterAudioFileName).and_then(makeAudioClip);
}

} // namespace narrator
