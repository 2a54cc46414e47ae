// SPDX-License-Identifier: Apache-2.0
#include "AdaptiveQualityScheduler.hpp"

#include <audio/WavFormat.hpp>
#include <core/EventLoop.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <span>
#include <thread>

namespace narrator
{

namespace
{

    constexpr auto FastPassPollInterval = std::chrono::milliseconds(50);

    struct FastPassRun
    {
        std::jthread thread;
        bool finished = false; ///< Guarded by the scheduler mutex.
    };

    struct UpgradeLoop
    {
        BookId book;
        ChapterId chapter;
        TierLadder ladder;
        int target = 0;
        AdaptiveQualityScheduler::CursorProvider currentIndex;
        AdaptiveQualityScheduler::SegmentCallback onUpgraded;
        EventLoop::TimerId timer = 0;
        bool cancelled = false;
    };

    using UpgradeLoopPtr = std::shared_ptr<UpgradeLoop>;

} // namespace

auto schedulerStateToString(SchedulerState state) -> std::string_view
{
    switch (state)
    {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::FastPass: return "fast-pass";
        case SchedulerState::UpgradeLoop: return "upgrade-loop";
        case SchedulerState::Cancelled: return "cancelled";
        case SchedulerState::Exhausted: return "exhausted";
    }
    return "unknown";
}

struct AdaptiveQualityScheduler::Impl
{
    GenerationCoordinator& coordinator;
    ResourceMonitor& monitor;
    SegmentProgressTracker& progress;
    SegmentStore& store;
    SchedulerOptions options;

    mutable std::mutex mutex;
    std::map<ChapterId, std::shared_ptr<FastPassRun>> fastPasses;
    std::map<ChapterId, UpgradeLoopPtr> upgrades;
    std::map<ChapterId, SchedulerState> states;
    std::condition_variable fastPassDone;

    EventLoop timers { "upgrade-timers" };

    Impl(GenerationCoordinator& coordinator,
         ResourceMonitor& monitor,
         SegmentProgressTracker& progress,
         SegmentStore& store,
         SchedulerOptions options):
        coordinator(coordinator), monitor(monitor), progress(progress), store(store), options(options)
    {
    }

    [[nodiscard]] auto fastPassRunning(const ChapterId& chapter) const -> bool
    {
        auto lock = std::lock_guard(mutex);
        auto const it = fastPasses.find(chapter);
        return it != fastPasses.end() && !it->second->finished;
    }

    void markFinished(FastPassRun& run)
    {
        {
            auto lock = std::lock_guard(mutex);
            run.finished = true;
        }
        fastPassDone.notify_all();
    }

    // {{{ fast pass

    /// @brief Waits for one generation, requesting it again once if it was cancelled by someone else.
    auto awaitGeneration(const std::stop_token& stopToken, const GenerationRequest& request) -> GenerationResult
    {
        auto result = GenerationResult { std::unexpected(Error { ErrorCode::Cancelled, "Fast pass stopped" }) };
        for (auto round = 0; round < 2; ++round)
        {
            auto future = coordinator.generate(request);
            while (future.wait_for(FastPassPollInterval) == std::future_status::timeout)
                if (stopToken.stop_requested())
                    return makeError(ErrorCode::Cancelled, "Fast pass stopped");

            result = future.get();
            if (result || errorKind(result.error().code) != ErrorKind::Cancellation || stopToken.stop_requested())
                return result;
            log::debug("Fast pass request for {} was cancelled, requesting it again", request.key);
        }
        return result;
    }

    void runFastPass(const std::stop_token& stopToken,
                     const BookId& book,
                     const ChapterId& chapter,
                     const std::vector<Segment>& segments,
                     int tier,
                     const TierConfig& voice,
                     const SegmentCallback& onSegmentReady,
                     const ChapterCallback& onComplete)
    {
        auto generatedCount = 0;
        for (auto const& segment: segments)
        {
            if (stopToken.stop_requested())
                break;

            progress.setProcessingIndex(chapter, segment.index);

            if (auto existing = progress.generatedSegment(chapter, segment.index); existing && existing->audio)
            {
                if (onSegmentReady)
                    onSegmentReady(chapter, *existing);
                continue;
            }

            auto const request = GenerationRequest {
                .key = SegmentKey { chapter, segment.index },
                .text = segment.text,
                .voice = voice,
                .tier = tier,
            };
            auto result = awaitGeneration(stopToken, request);
            if (!result)
            {
                if (stopToken.stop_requested())
                    break;
                log::error("Fast pass failed for segment {} of {}: {}", segment.index, chapter, result.error());
                continue;
            }

            auto ready = segment;
            ready.audio = result->audio;
            ready.durationSeconds = result->audio->durationSeconds();
            ready.qualityTier = result->tier;
            (void) progress.markSegmentGenerated(chapter, ready);
            progress.updateSegmentQuality(chapter, segment.index, result->tier);
            ++generatedCount;

            if (onSegmentReady)
                onSegmentReady(chapter, ready);
        }

        progress.setProcessingIndex(chapter, -1);
        if (stopToken.stop_requested())
        {
            log::debug("Fast pass of {} stopped", chapter);
            return;
        }

        if (generatedCount > 0)
            finishChapter(book, chapter);
        progress.markChapterComplete(chapter);

        {
            auto lock = std::lock_guard(mutex);
            if (states[chapter] == SchedulerState::FastPass)
                states[chapter] = SchedulerState::Idle;
        }
        log::info("Fast pass of {} complete ({} segment(s) generated)", chapter, generatedCount);

        if (onComplete)
            onComplete(chapter);
    }

    /// @brief Assigns start offsets, stores the segments and the assembled chapter audio.
    void finishChapter(const BookId& book, const ChapterId& chapter)
    {
        auto const segments = progress.assignStartOffsets(chapter);
        if (segments.empty())
            return;

        if (auto stored = store.putSegments(book, chapter, segments); !stored)
            log::error("Failed to store segments of {}: {}", chapter, stored.error());

        auto const snapshot = progress.snapshot(chapter);
        if (!snapshot || static_cast<int>(segments.size()) != snapshot->totalSegments)
        {
            log::warning("Chapter {} is incomplete ({} of {} segments), not assembling chapter audio",
                         chapter,
                         segments.size(),
                         snapshot ? snapshot->totalSegments : 0);
            return;
        }

        auto clips = std::vector<std::span<const std::uint8_t>> {};
        clips.reserve(segments.size());
        for (auto const& segment: segments)
            clips.emplace_back(segment.audio->bytes);

        auto assembled = concatenateWav(clips).and_then(makeAudioClip);
        if (!assembled)
        {
            log::warning("Cannot assemble chapter audio of {}: {}", chapter, assembled.error());
            return;
        }
        if (auto stored = store.putChapterAudio(book, chapter, *assembled); !stored)
            log::error("Failed to store chapter audio of {}: {}", chapter, stored.error());
        else
            log::info("Stored chapter audio of {} ({:.1f} s)", chapter, (*assembled)->durationSeconds());
    }

    void stopFastPass(const ChapterId& chapter)
    {
        auto run = std::shared_ptr<FastPassRun> {};
        {
            auto lock = std::lock_guard(mutex);
            auto const it = fastPasses.find(chapter);
            if (it == fastPasses.end())
                return;
            run = std::move(it->second);
            fastPasses.erase(it);
        }

        run->thread.request_stop();
        if (run->thread.get_id() == std::this_thread::get_id())
            run->thread.detach();
        else if (run->thread.joinable())
            run->thread.join();
    }

    // }}}

    // {{{ upgrade loop

    [[nodiscard]] auto isCancelled(const UpgradeLoopPtr& loop) const -> bool
    {
        auto lock = std::lock_guard(mutex);
        return loop->cancelled;
    }

    void scheduleNext(const UpgradeLoopPtr& loop, std::chrono::milliseconds delay)
    {
        auto lock = std::lock_guard(mutex);
        if (loop->cancelled)
            return;
        loop->timer = timers.postDelayed(delay, [this, loop] { tick(loop); });
    }

    void finishLoop(const UpgradeLoopPtr& loop, SchedulerState state)
    {
        auto lock = std::lock_guard(mutex);
        if (loop->cancelled)
            return;
        loop->cancelled = true;
        if (auto const it = upgrades.find(loop->chapter); it != upgrades.end() && it->second == loop)
            upgrades.erase(it);
        states[loop->chapter] = state;
    }

    void tick(const UpgradeLoopPtr& loop)
    {
        if (isCancelled(loop))
            return;

        if (!monitor.canRunUpgradeNow())
        {
            log::debug("Skipping upgrade tick for {}: resources constrained", loop->chapter);
            scheduleNext(loop, options.interval);
            return;
        }

        auto const snapshot = progress.snapshot(loop->chapter);
        if (!snapshot)
        {
            scheduleNext(loop, options.interval);
            return;
        }

        auto const current = loop->currentIndex ? loop->currentIndex() : 0;
        auto upcoming = std::vector<int> {};
        auto played = std::vector<int> {};
        for (auto const& [index, tier]: snapshot->segmentQuality)
        {
            if (tier >= loop->target)
                continue;
            if (index > current && index <= current + options.horizon)
                upcoming.push_back(index);
            else if (options.upgradePlayed && index < current)
                played.push_back(index);
        }
        std::ranges::sort(upcoming);
        std::ranges::sort(played, std::greater {});

        if (upcoming.empty() && played.empty())
        {
            if (fastPassRunning(loop->chapter))
            {
                scheduleNext(loop, options.interval);
                return;
            }
            log::info("All segments of {} at target tier {}, upgrade complete", loop->chapter, loop->target);
            finishLoop(loop, SchedulerState::Exhausted);
            return;
        }

        auto const index = upcoming.empty() ? played.front() : upcoming.front();
        auto const currentTier = snapshot->segmentQuality.at(index);
        auto const nextTier = loop->ladder.lowestFrom(currentTier + 1);
        auto const segment = snapshot->generatedSegments.find(index);
        if (!nextTier || *nextTier > loop->target || segment == snapshot->generatedSegments.end())
        {
            scheduleNext(loop, options.interval);
            return;
        }

        log::debug("Upgrading segment {} of {} from tier {} to {}", index, loop->chapter, currentTier, *nextTier);
        auto request = GenerationRequest {
            .key = SegmentKey { loop->chapter, index },
            .text = segment->second.text,
            .voice = *loop->ladder.at(*nextTier),
            .tier = *nextTier,
        };
        coordinator.generate(std::move(request),
                             [this, loop, original = segment->second, handle = timers.handle()](
                                 const GenerationResult& result) {
                                 (void) handle.post([this, loop, original, result] {
                                     onUpgradeDone(loop, original, result);
                                 });
                             });
    }

    void onUpgradeDone(const UpgradeLoopPtr& loop, const Segment& original, const GenerationResult& result)
    {
        if (isCancelled(loop))
            return;

        auto const recorded = progress.segmentQuality(loop->chapter, original.index).value_or(0);
        if (!result)
            log::warning("Failed to upgrade segment {} of {}: {}", original.index, loop->chapter, result.error());
        else if (result->tier <= recorded)
            log::debug("Ignoring tier {} result for segment {} already at tier {}", result->tier, original.index, recorded);
        else
        {
            auto upgraded = original;
            upgraded.audio = result->audio;
            upgraded.durationSeconds = result->audio->durationSeconds();
            upgraded.qualityTier = result->tier;

            if (auto stored = store.putSegment(loop->book, loop->chapter, upgraded); !stored)
                log::warning("Failed to store upgraded segment {}: {}", original.index, stored.error());

            (void) progress.upgradeSegment(loop->chapter, upgraded);
            progress.updateSegmentQuality(loop->chapter, original.index, result->tier);
            if (loop->onUpgraded)
                loop->onUpgraded(loop->chapter, upgraded);
            log::info("Segment {} of {} upgraded to tier {}", original.index, loop->chapter, result->tier);
        }

        scheduleNext(loop, options.interval);
    }

    void stopUpgrade(const ChapterId& chapter)
    {
        auto lock = std::lock_guard(mutex);
        auto const it = upgrades.find(chapter);
        if (it == upgrades.end())
            return;
        it->second->cancelled = true;
        if (it->second->timer != 0)
            timers.cancel(it->second->timer);
        upgrades.erase(it);
        states[chapter] = SchedulerState::Cancelled;
        log::debug("Cancelled upgrade loop of {}", chapter);
    }

    // }}}
};

AdaptiveQualityScheduler::AdaptiveQualityScheduler(GenerationCoordinator& coordinator,
                                                   ResourceMonitor& monitor,
                                                   SegmentProgressTracker& progress,
                                                   SegmentStore& store,
                                                   SchedulerOptions options):
    _impl(std::make_unique<Impl>(coordinator, monitor, progress, store, options))
{
}

AdaptiveQualityScheduler::~AdaptiveQualityScheduler()
{
    cancelAll();
    _impl->timers.stop();
}

auto AdaptiveQualityScheduler::startFastPass(BookId book,
                                             ChapterId chapter,
                                             std::vector<Segment> segments,
                                             const TierLadder& ladder,
                                             SegmentCallback onSegmentReady,
                                             ChapterCallback onComplete) -> Result<int>
{
    auto const tier = ladder.lowestFrom(_impl->monitor.startingTier());
    if (!tier)
        return makeError(ErrorCode::UnsupportedVoice, std::format("No usable tier for the fast pass of {}", chapter));

    _impl->stopFastPass(chapter);

    log::info("Fast pass of {} at tier {} ({} segments)", chapter, *tier, segments.size());

    auto run = std::make_shared<FastPassRun>();
    auto lock = std::lock_guard(_impl->mutex);
    _impl->states[chapter] = SchedulerState::FastPass;
    _impl->fastPasses[chapter] = run;
    run->thread = std::jthread([impl = _impl.get(),
                                run,
                                book = std::move(book),
                                chapter,
                                segments = std::move(segments),
                                tier = *tier,
                                voice = *ladder.at(*tier),
                                onSegmentReady = std::move(onSegmentReady),
                                onComplete = std::move(onComplete)](const std::stop_token& stopToken) {
        impl->runFastPass(stopToken, book, chapter, segments, tier, voice, onSegmentReady, onComplete);
        impl->markFinished(*run);
    });
    return *tier;
}

void AdaptiveQualityScheduler::cancelFastPass(const ChapterId& chapter)
{
    _impl->stopFastPass(chapter);
}

void AdaptiveQualityScheduler::waitForFastPass(const ChapterId& chapter)
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const it = _impl->fastPasses.find(chapter);
    if (it == _impl->fastPasses.end())
        return;
    auto const run = it->second;
    if (run->thread.get_id() == std::this_thread::get_id())
        return;
    _impl->fastPassDone.wait(lock, [&run] { return run->finished; });
}

auto AdaptiveQualityScheduler::scheduleUpgradePass(BookId book,
                                                   ChapterId chapter,
                                                   const TierLadder& ladder,
                                                   CursorProvider currentIndex,
                                                   SegmentCallback onSegmentUpgraded) -> bool
{
    cancelUpgrade(chapter);

    auto const target = effectiveTarget(ladder);
    if (target <= 0)
    {
        log::info("No upgrade possible for {}: nothing above tier 0", chapter);
        return false;
    }

    auto loop = std::make_shared<UpgradeLoop>(UpgradeLoop {
        .book = std::move(book),
        .chapter = chapter,
        .ladder = ladder,
        .target = target,
        .currentIndex = std::move(currentIndex),
        .onUpgraded = std::move(onSegmentUpgraded),
    });

    auto lock = std::lock_guard(_impl->mutex);
    _impl->upgrades[chapter] = loop;
    _impl->states[chapter] = SchedulerState::UpgradeLoop;
    loop->timer = _impl->timers.postDelayed(_impl->options.startDelay, [impl = _impl.get(), loop] { impl->tick(loop); });
    log::info("Upgrade loop of {} scheduled (target tier {})", chapter, target);
    return true;
}

void AdaptiveQualityScheduler::cancelUpgrade(const ChapterId& chapter)
{
    _impl->stopUpgrade(chapter);
}

void AdaptiveQualityScheduler::cancelAll()
{
    auto chapters = std::vector<ChapterId> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        for (auto const& [chapter, run]: _impl->fastPasses)
            chapters.push_back(chapter);
        for (auto const& [chapter, loop]: _impl->upgrades)
            chapters.push_back(chapter);
    }
    for (auto const& chapter: chapters)
    {
        _impl->stopFastPass(chapter);
        _impl->stopUpgrade(chapter);
    }
}

auto AdaptiveQualityScheduler::state(const ChapterId& chapter) const -> SchedulerState
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->states.find(chapter);
    return it == _impl->states.end() ? SchedulerState::Idle : it->second;
}

auto AdaptiveQualityScheduler::effectiveTarget(const TierLadder& ladder) const -> int
{
    return ladder.walkDown(_impl->monitor.targetTier()).value_or(0);
}

} // namespace narrator
