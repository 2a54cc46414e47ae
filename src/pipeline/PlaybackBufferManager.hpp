// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventLoop.hpp>
#include <core/Types.hpp>
#include <library/SegmentStore.hpp>
#include <pipeline/SegmentAudioTable.hpp>
#include <pipeline/SegmentProgressTracker.hpp>
#include <tts/GenerationCoordinator.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace narrator
{

/// @brief Window settings of the PlaybackBufferManager.
struct BufferOptions
{
    int lookahead = 5;                   ///< Segments kept ready ahead of the cursor.
    int evictTrail = 5;                  ///< Segments kept behind the cursor.
    std::size_t maxParallelPrefetch = 5; ///< Prefetch requests handed to the coordinator at once.
};

/// @brief Voice and tier used for segments the buffer has to generate itself.
struct GenerationTarget
{
    TierConfig voice;
    int tier = 0;
};

/// @brief Keeps generated audio available in a window around the playback cursor.
///
/// Missing segments are taken from the chapter progress, then from storage, and
/// generated as a last resort. All methods must be called on the event loop passed
/// to the constructor; callbacks are delivered on that loop as well.
class PlaybackBufferManager
{
  public:
    using ReadyCallback = std::function<void(int index, const Result<AudioHandle>& audio)>;

    PlaybackBufferManager(EventLoop& loop,
                          GenerationCoordinator& coordinator,
                          SegmentProgressTracker& progress,
                          SegmentStore& store,
                          BufferOptions options = {});

    PlaybackBufferManager(const PlaybackBufferManager&) = delete;
    PlaybackBufferManager& operator=(const PlaybackBufferManager&) = delete;

    /// @brief Switches to a chapter, dropping everything buffered for the previous one.
    void loadChapter(BookId book, ChapterId chapter, std::vector<Segment> segments, GenerationTarget target);

    /// @brief Releases every handle and forgets queued work. In-flight results are ignored.
    void unloadChapter();

    /// @brief Tops up [cursor, cursor + lookahead] and evicts below cursor - evictTrail.
    void ensureWindow(int cursor);

    /// @brief Delivers the audio of one segment as soon as possible (underrun path).
    ///
    /// An already pending generation of the segment is moved ahead of other work
    /// instead of being requested twice.
    void request(int index, ReadyCallback onReady);

    /// @brief Drops prefetch requests that have not been handed to the coordinator yet.
    void clearPendingPrefetch();

    /// @brief Cancels all generation in flight (coordinator included) and queued prefetch.
    void cancelGeneration();

    /// @brief Installs a higher-tier version of a buffered segment.
    /// @return True if the segment is buffered and was replaced.
    auto offer(int index, AudioHandle audio, int tier) -> bool;

    [[nodiscard]] auto audioAt(int index) const -> AudioHandle;
    [[nodiscard]] auto tierAt(int index) const -> std::optional<int>;
    [[nodiscard]] auto bufferedIndices() const -> std::vector<int>;
    [[nodiscard]] auto inFlightIndices() const -> std::vector<int>;
    [[nodiscard]] auto queuedCount() const -> std::size_t { return _queued.size(); }
    [[nodiscard]] auto segmentCount() const -> int { return static_cast<int>(_segments.size()); }
    [[nodiscard]] auto chapterId() const -> const ChapterId& { return _chapter; }
    [[nodiscard]] auto options() const -> const BufferOptions& { return _options; }

  private:
    /// @brief Fills the table from progress or storage.
    /// @return True if the segment is now buffered.
    auto loadExisting(int index) -> bool;

    void dispatch(int index, bool urgent);
    void pump();
    void onGenerated(std::uint64_t chapterEpoch, std::uint64_t dispatchEpoch, int index, GenerationResult result);
    void deliver(int index, const Result<AudioHandle>& audio);
    void failAllWaiters(const Error& error);
    [[nodiscard]] auto prefetchInFlight() const -> std::size_t;
    [[nodiscard]] auto inWindow(int index) const -> bool;

    EventLoop& _loop;
    GenerationCoordinator& _coordinator;
    SegmentProgressTracker& _progress;
    SegmentStore& _store;
    BufferOptions _options;

    BookId _book;
    ChapterId _chapter;
    std::vector<Segment> _segments;
    GenerationTarget _target;
    int _cursor = 0;

    SegmentAudioTable _table;
    std::map<int, bool> _inFlight; ///< index -> urgent
    std::deque<int> _queued;
    std::map<int, std::vector<ReadyCallback>> _waiters;
    std::uint64_t _chapterEpoch = 0;
    std::uint64_t _dispatchEpoch = 0;
};

} // namespace narrator
