// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioOutput.hpp>
#include <core/Types.hpp>
#include <library/SegmentStore.hpp>
#include <pipeline/PlaybackBufferManager.hpp>
#include <pipeline/PlaybackEvent.hpp>
#include <pipeline/SegmentProgressTracker.hpp>
#include <tts/GenerationCoordinator.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace narrator
{

/// @brief Settings of the PlaybackController.
struct PlaybackOptions
{
    BufferOptions buffer;
    double speed = 1.0;
    double wordsPerMinute = 160.0;
    std::chrono::milliseconds positionInterval { 250 }; ///< Period of position reports while playing.
};

/// @brief Playback state machine of one chapter at a time.
///
/// Transport verbs may be called from any thread; they are queued onto the
/// controller's own event loop and applied in call order. Events are delivered on
/// that loop as well, so a listener must not block.
class PlaybackController
{
  public:
    using Listener = std::function<void(const PlaybackEvent& event)>;

    static constexpr auto MinSpeed = 0.25;
    static constexpr auto MaxSpeed = 4.0;

    PlaybackController(GenerationCoordinator& coordinator,
                       SegmentProgressTracker& progress,
                       SegmentStore& store,
                       AudioOutput& output,
                       PlaybackOptions options = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// @brief Installs the event listener. Call before the first verb.
    void setListener(Listener listener);

    /// @brief Loads a chapter and parks the cursor at @p startIndex, paused.
    void loadChapter(
        BookId book, ChapterId chapter, std::vector<Segment> segments, GenerationTarget target, int startIndex = 0);

    /// @brief Resumes in place when paused on a loaded segment, otherwise starts the cursor segment.
    ///
    /// After the chapter has ended, playback restarts from the first segment.
    void play();

    /// @brief Suspends audio, keeping in-flight generation but dropping queued prefetch.
    void pause();

    void toggle();
    void skipNext();
    void skipPrevious();

    /// @brief Moves the cursor, continuing to play if playback was running.
    void seekToSegment(int index);

    /// @brief Sets the playback rate, clamped to [MinSpeed, MaxSpeed].
    void setSpeed(double speed);

    /// @brief Stops playback and releases the chapter's buffered audio.
    void stop();

    /// @brief Records a segment produced by the fast pass (refines the duration estimate).
    void onSegmentGenerated(const ChapterId& chapter, const Segment& segment);

    /// @brief Installs an upgraded segment, swapping it in if it is audible right now.
    void onSegmentUpgraded(const ChapterId& chapter, const Segment& segment);

    /// @brief Blocks until every verb queued so far has been applied.
    void sync();

    [[nodiscard]] auto state() const -> PlaybackState;
    [[nodiscard]] auto cursor() const -> PlaybackCursor;

    /// @brief Returns the cursor segment index, or -1 without a chapter. Safe from any thread.
    [[nodiscard]] auto currentIndex() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
