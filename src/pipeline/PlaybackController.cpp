// SPDX-License-Identifier: Apache-2.0
#include "PlaybackController.hpp"

#include <core/EventLoop.hpp>
#include <core/Log.hpp>
#include <text/DurationEstimator.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <format>
#include <mutex>

namespace narrator
{

struct PlaybackController::Impl
{
    SegmentProgressTracker& progress;
    AudioOutput& output;
    PlaybackOptions options;

    EventLoop loop { "playback" };
    PlaybackBufferManager buffer;
    DurationEstimator estimator;
    Listener listener;

    // Loop-thread state
    PlaybackState state = PlaybackState::Stopped;
    bool buffering = false;
    BookId book;
    ChapterId chapter;
    std::vector<Segment> segments;
    int index = -1;
    double speed = 1.0;
    double lastDuration = 0.0;
    std::uint64_t token = 0; ///< Bumped whenever audio wiring becomes obsolete.
    int loadedIndex = -1;    ///< Segment whose clip sits in the output, or -1.
    AudioHandle loadedAudio;
    EventLoop::TimerId positionTimer = 0;

    // Published for other threads
    mutable std::mutex publishedMutex;
    PlaybackState publishedState = PlaybackState::Stopped;
    PlaybackCursor publishedCursor;
    std::atomic<int> publishedIndex { -1 };

    Impl(GenerationCoordinator& coordinator,
         SegmentProgressTracker& progress,
         SegmentStore& store,
         AudioOutput& output,
         PlaybackOptions options):
        progress(progress),
        output(output),
        options(options),
        buffer(loop, coordinator, progress, store, options.buffer),
        estimator(options.wordsPerMinute),
        speed(std::clamp(options.speed, MinSpeed, MaxSpeed))
    {
    }

    [[nodiscard]] auto hasChapter() const -> bool { return !segments.empty(); }
    [[nodiscard]] auto segmentCount() const -> int { return static_cast<int>(segments.size()); }

    // {{{ reporting

    void emit(PlaybackEvent event)
    {
        if (listener)
            listener(event);
    }

    [[nodiscard]] auto makeCursor() const -> PlaybackCursor
    {
        auto const segmentTime = loadedIndex == index && loadedAudio ? output.positionSeconds() : 0.0;
        return PlaybackCursor {
            .currentSegmentIndex = index,
            .segmentTimeSeconds = segmentTime,
            .currentTimeSeconds = hasChapter() ? estimator.secondsBefore(index) + segmentTime : 0.0,
            .durationSeconds = hasChapter() ? estimator.estimateSeconds() : 0.0,
            .speed = speed,
            .isPlaying = state == PlaybackState::Playing,
            .isBuffering = buffering,
        };
    }

    void publish()
    {
        auto const cursor = makeCursor();
        {
            auto lock = std::lock_guard(publishedMutex);
            publishedState = state;
            publishedCursor = cursor;
        }
        publishedIndex = index;
    }

    void emitPosition()
    {
        publish();
        emit(PositionChangedEvent { makeCursor() });
    }

    void setState(PlaybackState newState)
    {
        if (state == newState)
            return;
        log::debug("Playback {} -> {}", playbackStateToString(state), playbackStateToString(newState));
        state = newState;
        publish();
        emit(StateChangedEvent { newState });

        if (state == PlaybackState::Playing)
            schedulePositionReport();
        else if (positionTimer != 0)
        {
            loop.cancel(positionTimer);
            positionTimer = 0;
        }
    }

    void setBuffering(bool value)
    {
        if (buffering == value)
            return;
        buffering = value;
        publish();
        emit(BufferingChangedEvent { value });
    }

    void setIndex(int newIndex)
    {
        if (index == newIndex)
            return;
        index = newIndex;
        publish();
        emit(SegmentChangedEvent { newIndex });
    }

    void recordDuration(int segmentIndex, const AudioHandle& audio)
    {
        if (!audio)
            return;
        estimator.recordMeasured(segmentIndex, audio->durationSeconds());
        auto const duration = estimator.estimateSeconds();
        if (std::abs(duration - lastDuration) < 0.001)
            return;
        lastDuration = duration;
        emit(DurationChangedEvent { duration });
    }

    void schedulePositionReport()
    {
        if (positionTimer != 0)
            loop.cancel(positionTimer);
        positionTimer = loop.postDelayed(options.positionInterval, [this] {
            positionTimer = 0;
            if (state != PlaybackState::Playing)
                return;
            emitPosition();
            schedulePositionReport();
        });
    }

    // }}}

    // {{{ audio wiring

    void releaseOutput()
    {
        ++token;
        output.stop();
        loadedIndex = -1;
        loadedAudio.reset();
    }

    void fail(const Error& error)
    {
        log::error("Playback of {} stopped: {}", chapter, error);
        releaseOutput();
        setBuffering(false);
        setState(PlaybackState::Stopped);
        emit(PlaybackErrorEvent { error });
        emitPosition();
    }

    /// @brief Plays the cursor segment, waiting for its audio if necessary.
    void startSegment()
    {
        releaseOutput();
        setState(PlaybackState::Playing);
        buffer.ensureWindow(index);

        if (auto audio = buffer.audioAt(index))
        {
            beginAudio(index, std::move(audio));
            return;
        }

        log::info("Buffering segment {} of {}", index, chapter);
        setBuffering(true);
        buffer.request(index, [this, expected = token](int segmentIndex, const Result<AudioHandle>& audio) {
            onUnderrunResolved(expected, segmentIndex, audio);
        });
    }

    void onUnderrunResolved(std::uint64_t expected, int segmentIndex, const Result<AudioHandle>& audio)
    {
        if (expected != token || segmentIndex != index || state != PlaybackState::Playing)
            return;

        setBuffering(false);
        if (!audio && errorKind(audio.error().code) == ErrorKind::Cancellation)
        {
            log::info("Generation of segment {} was cancelled, pausing", segmentIndex);
            setState(PlaybackState::Paused);
            emitPosition();
            return;
        }
        if (!audio)
        {
            fail(audio.error());
            return;
        }
        beginAudio(segmentIndex, *audio);
    }

    void beginAudio(int segmentIndex, AudioHandle audio)
    {
        recordDuration(segmentIndex, audio);
        output.setSpeed(speed);

        auto const expected = token;
        auto played = output.play(audio, [handle = loop.handle(), this, expected] {
            (void) handle.post([this, expected] { onSegmentFinished(expected); });
        });
        if (!played)
        {
            fail(played.error());
            return;
        }

        loadedIndex = segmentIndex;
        loadedAudio = std::move(audio);
        emitPosition();
    }

    void onSegmentFinished(std::uint64_t expected)
    {
        if (expected != token || state != PlaybackState::Playing)
            return;

        if (index + 1 >= segmentCount())
        {
            log::info("Chapter {} finished", chapter);
            releaseOutput();
            setState(PlaybackState::Ended);
            emitPosition();
            return;
        }

        setIndex(index + 1);
        startSegment();
    }

    // }}}

    // {{{ verbs

    void loadChapter(BookId newBook,
                     ChapterId newChapter,
                     std::vector<Segment> newSegments,
                     GenerationTarget target,
                     int startIndex)
    {
        releaseOutput();
        setBuffering(false);
        setState(PlaybackState::Loading);

        book = std::move(newBook);
        chapter = std::move(newChapter);
        segments = std::move(newSegments);
        estimator.reset(segments);
        buffer.loadChapter(book, chapter, segments, std::move(target));

        if (segments.empty())
        {
            index = -1;
            fail(Error { ErrorCode::InvalidArgument, std::format("Chapter {} has no segments", chapter) });
            return;
        }

        for (auto const& segment: segments)
            if (auto generated = progress.generatedSegment(chapter, segment.index); generated && generated->audio)
                estimator.recordMeasured(segment.index, generated->audio->durationSeconds());
        lastDuration = estimator.estimateSeconds();
        emit(DurationChangedEvent { lastDuration });

        index = -1;
        setIndex(std::clamp(startIndex, 0, segmentCount() - 1));
        buffer.ensureWindow(index);
        setState(PlaybackState::Paused);
        emitPosition();
    }

    void play()
    {
        if (!hasChapter())
        {
            log::warning("Nothing to play: no chapter loaded");
            return;
        }

        switch (state)
        {
            case PlaybackState::Playing:
            case PlaybackState::Loading: return;
            case PlaybackState::Ended: setIndex(0); break;
            case PlaybackState::Paused:
                if (loadedIndex == index && loadedAudio)
                {
                    if (auto resumed = output.resume(); !resumed)
                    {
                        fail(resumed.error());
                        return;
                    }
                    setState(PlaybackState::Playing);
                    emitPosition();
                    return;
                }
                break;
            case PlaybackState::Stopped: break;
        }
        startSegment();
    }

    void pause()
    {
        if (state != PlaybackState::Playing)
            return;

        if (buffering)
        {
            // The pending audio still lands in the buffer; only the wiring is dropped.
            ++token;
            setBuffering(false);
        }
        output.pause();
        buffer.clearPendingPrefetch();
        setState(PlaybackState::Paused);
        emitPosition();
    }

    void skipTo(int target)
    {
        if (!hasChapter())
            return;
        if (target < 0 || target >= segmentCount())
        {
            log::warning("Cannot skip to segment {}: chapter {} has {} segments", target, chapter, segmentCount());
            return;
        }

        auto const wasPlaying = state == PlaybackState::Playing;
        releaseOutput();
        setBuffering(false);
        buffer.cancelGeneration();
        setIndex(target);

        if (wasPlaying)
        {
            startSegment();
            return;
        }
        buffer.ensureWindow(index);
        setState(PlaybackState::Paused);
        emitPosition();
    }

    void setSpeed(double value)
    {
        if (!std::isfinite(value) || value <= 0.0)
        {
            log::warning("Ignoring invalid playback speed {}", value);
            return;
        }
        speed = std::clamp(value, MinSpeed, MaxSpeed);
        output.setSpeed(speed);
        emitPosition();
    }

    void stop()
    {
        releaseOutput();
        setBuffering(false);
        buffer.unloadChapter();
        segments.clear();
        chapter.clear();
        book.clear();
        index = -1;
        setState(PlaybackState::Stopped);
        emitPosition();
    }

    void onSegmentGenerated(const ChapterId& from, const Segment& segment)
    {
        if (from != chapter || !segment.audio)
            return;
        recordDuration(segment.index, segment.audio);
    }

    void onSegmentUpgraded(const ChapterId& from, const Segment& segment)
    {
        if (from != chapter || !segment.audio)
            return;

        auto const tier = segment.qualityTier.value_or(0);
        recordDuration(segment.index, segment.audio);
        (void) buffer.offer(segment.index, segment.audio, tier);

        auto swapped = false;
        if (segment.index == loadedIndex && loadedAudio)
        {
            swapped = output.swap(segment.audio);
            if (swapped)
                loadedAudio = segment.audio;
            else
                log::debug("Swap of segment {} deferred until it is entered again", segment.index);
        }
        emit(SegmentUpgradedEvent { .index = segment.index, .tier = tier, .swapped = swapped });
    }

    // }}}
};

PlaybackController::PlaybackController(GenerationCoordinator& coordinator,
                                       SegmentProgressTracker& progress,
                                       SegmentStore& store,
                                       AudioOutput& output,
                                       PlaybackOptions options):
    _impl(std::make_unique<Impl>(coordinator, progress, store, output, options))
{
}

PlaybackController::~PlaybackController()
{
    _impl->loop.stop();
    _impl->output.stop();
}

void PlaybackController::setListener(Listener listener)
{
    _impl->loop.invoke([this, &listener] { _impl->listener = std::move(listener); });
}

void PlaybackController::loadChapter(
    BookId book, ChapterId chapter, std::vector<Segment> segments, GenerationTarget target, int startIndex)
{
    _impl->loop.post([impl = _impl.get(),
                      book = std::move(book),
                      chapter = std::move(chapter),
                      segments = std::move(segments),
                      target = std::move(target),
                      startIndex]() mutable {
        impl->loadChapter(std::move(book), std::move(chapter), std::move(segments), std::move(target), startIndex);
    });
}

void PlaybackController::play()
{
    _impl->loop.post([impl = _impl.get()] { impl->play(); });
}

void PlaybackController::pause()
{
    _impl->loop.post([impl = _impl.get()] { impl->pause(); });
}

void PlaybackController::toggle()
{
    _impl->loop.post([impl = _impl.get()] {
        if (impl->state == PlaybackState::Playing)
            impl->pause();
        else
            impl->play();
    });
}

void PlaybackController::skipNext()
{
    _impl->loop.post([impl = _impl.get()] {
        if (impl->index + 1 < impl->segmentCount())
            impl->skipTo(impl->index + 1);
    });
}

void PlaybackController::skipPrevious()
{
    _impl->loop.post([impl = _impl.get()] {
        if (impl->index > 0)
            impl->skipTo(impl->index - 1);
    });
}

void PlaybackController::seekToSegment(int index)
{
    _impl->loop.post([impl = _impl.get(), index] { impl->skipTo(index); });
}

void PlaybackController::setSpeed(double speed)
{
    _impl->loop.post([impl = _impl.get(), speed] { impl->setSpeed(speed); });
}

void PlaybackController::stop()
{
    _impl->loop.post([impl = _impl.get()] { impl->stop(); });
}

void PlaybackController::onSegmentGenerated(const ChapterId& chapter, const Segment& segment)
{
    _impl->loop.post([impl = _impl.get(), chapter, segment] { impl->onSegmentGenerated(chapter, segment); });
}

void PlaybackController::onSegmentUpgraded(const ChapterId& chapter, const Segment& segment)
{
    _impl->loop.post([impl = _impl.get(), chapter, segment] { impl->onSegmentUpgraded(chapter, segment); });
}

void PlaybackController::sync()
{
    _impl->loop.invoke([] {});
}

auto PlaybackController::state() const -> PlaybackState
{
    auto lock = std::lock_guard(_impl->publishedMutex);
    return _impl->publishedState;
}

auto PlaybackController::cursor() const -> PlaybackCursor
{
    auto lock = std::lock_guard(_impl->publishedMutex);
    return _impl->publishedCursor;
}

auto PlaybackController::currentIndex() const -> int
{
    return _impl->publishedIndex;
}

} // namespace narrator
