// SPDX-License-Identifier: Apache-2.0
#include "PlaybackBufferManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace narrator
{

PlaybackBufferManager::PlaybackBufferManager(EventLoop& loop,
                                             GenerationCoordinator& coordinator,
                                             SegmentProgressTracker& progress,
                                             SegmentStore& store,
                                             BufferOptions options):
    _loop(loop), _coordinator(coordinator), _progress(progress), _store(store), _options(options)
{
}

void PlaybackBufferManager::loadChapter(BookId book,
                                        ChapterId chapter,
                                        std::vector<Segment> segments,
                                        GenerationTarget target)
{
    unloadChapter();
    _book = std::move(book);
    _chapter = std::move(chapter);
    _segments = std::move(segments);
    _target = std::move(target);
    _cursor = 0;
    log::debug("Buffer loaded chapter {} ({} segments, tier {})", _chapter, _segments.size(), _target.tier);
}

void PlaybackBufferManager::unloadChapter()
{
    ++_chapterEpoch;
    ++_dispatchEpoch;
    _table.clear();
    _queued.clear();
    _inFlight.clear();
    failAllWaiters(Error { ErrorCode::Cancelled, "Chapter unloaded" });
}

void PlaybackBufferManager::ensureWindow(int cursor)
{
    _cursor = cursor;
    if (auto const evicted = _table.evictBefore(cursor - _options.evictTrail); evicted > 0)
        log::trace("Evicted {} segment(s) behind {}", evicted, cursor);

    std::erase_if(_queued, [this](int index) { return !inWindow(index); });

    auto const last = std::min(cursor + _options.lookahead, segmentCount() - 1);
    for (auto index = std::max(cursor, 0); index <= last; ++index)
    {
        if (_table.contains(index) || _inFlight.contains(index) || std::ranges::contains(_queued, index))
            continue;
        if (!loadExisting(index))
            _queued.push_back(index);
    }
    pump();
}

void PlaybackBufferManager::request(int index, ReadyCallback onReady)
{
    if (index < 0 || index >= segmentCount())
    {
        auto const error = Error { ErrorCode::InvalidArgument, std::format("No segment {} in chapter {}", index, _chapter) };
        _loop.post([onReady = std::move(onReady), index, error] { onReady(index, std::unexpected(error)); });
        return;
    }

    if (_table.contains(index) || loadExisting(index))
    {
        _loop.post([onReady = std::move(onReady), index, audio = _table.audio(index)] { onReady(index, audio); });
        return;
    }

    _waiters[index].push_back(std::move(onReady));
    std::erase(_queued, index);

    if (auto const it = _inFlight.find(index); it != _inFlight.end())
    {
        it->second = true;
        (void) _coordinator.prioritize(SegmentKey { _chapter, index });
        pump();
        return;
    }

    log::debug("Underrun at segment {}, generating ahead of prefetch", index);
    dispatch(index, true);
}

void PlaybackBufferManager::clearPendingPrefetch()
{
    _queued.clear();
}

void PlaybackBufferManager::cancelGeneration()
{
    _coordinator.cancelAll();
    ++_dispatchEpoch;
    _inFlight.clear();
    _queued.clear();
    failAllWaiters(Error { ErrorCode::Cancelled, "Generation cancelled" });
}

auto PlaybackBufferManager::offer(int index, AudioHandle audio, int tier) -> bool
{
    if (!_table.contains(index))
        return false;
    return _table.offer(index, std::move(audio), tier);
}

auto PlaybackBufferManager::audioAt(int index) const -> AudioHandle
{
    return _table.audio(index);
}

auto PlaybackBufferManager::tierAt(int index) const -> std::optional<int>
{
    return _table.tier(index);
}

auto PlaybackBufferManager::bufferedIndices() const -> std::vector<int>
{
    return _table.indices();
}

auto PlaybackBufferManager::inFlightIndices() const -> std::vector<int>
{
    auto result = std::vector<int> {};
    for (auto const& [index, urgent]: _inFlight)
        result.push_back(index);
    return result;
}

auto PlaybackBufferManager::loadExisting(int index) -> bool
{
    if (auto const generated = _progress.generatedSegment(_chapter, index); generated && generated->audio)
    {
        _table.replace(index, generated->audio, generated->qualityTier.value_or(0));
        return true;
    }

    auto stored = _store.getSegment(_book, _chapter, index);
    if (!stored)
    {
        log::warning("Cannot read stored segment {} of {}: {}", index, _chapter, stored.error().message);
        return false;
    }
    if (!*stored || !(*stored)->audio)
        return false;

    auto const tier = (*stored)->qualityTier.value_or(0);
    auto audio = (*stored)->audio;
    (void) _progress.markSegmentGenerated(_chapter, std::move(**stored));
    _table.replace(index, std::move(audio), tier);
    log::trace("Reloaded segment {} of {} from storage", index, _chapter);
    return true;
}

void PlaybackBufferManager::dispatch(int index, bool urgent)
{
    _inFlight.insert_or_assign(index, urgent);

    auto const& segment = _segments[static_cast<std::size_t>(index)];
    auto request = GenerationRequest {
        .key = SegmentKey { _chapter, index },
        .text = segment.text,
        .voice = _target.voice,
        .tier = _target.tier,
        .urgent = urgent,
    };

    _coordinator.generate(
        std::move(request),
        [loop = _loop.handle(), this, chapterEpoch = _chapterEpoch, dispatchEpoch = _dispatchEpoch, index](
            const GenerationResult& result) {
            (void) loop.post([this, chapterEpoch, dispatchEpoch, index, result] {
                onGenerated(chapterEpoch, dispatchEpoch, index, result);
            });
        });
}

void PlaybackBufferManager::pump()
{
    while (!_queued.empty() && prefetchInFlight() < _options.maxParallelPrefetch)
    {
        auto const index = _queued.front();
        _queued.pop_front();
        if (_table.contains(index) || _inFlight.contains(index))
            continue;
        dispatch(index, false);
    }
}

void PlaybackBufferManager::onGenerated(std::uint64_t chapterEpoch,
                                        std::uint64_t dispatchEpoch,
                                        int index,
                                        GenerationResult result)
{
    if (chapterEpoch != _chapterEpoch)
        return;

    auto const current = dispatchEpoch == _dispatchEpoch;
    if (current)
        _inFlight.erase(index);

    if (!result)
    {
        if (current)
        {
            if (errorKind(result.error().code) != ErrorKind::Cancellation)
                log::warning("Segment {} of {} could not be generated: {}", index, _chapter, result.error());
            deliver(index, std::unexpected(result.error()));
            pump();
        }
        return;
    }

    auto segment = _segments[static_cast<std::size_t>(index)];
    segment.audio = result->audio;
    segment.durationSeconds = result->audio->durationSeconds();
    segment.qualityTier = result->tier;
    (void) _progress.markSegmentGenerated(_chapter, std::move(segment));

    // Prefer whatever the progress record holds now; an upgrade may have landed meanwhile.
    auto best = _progress.generatedSegment(_chapter, index);
    auto audio = best && best->audio ? best->audio : result->audio;
    auto const tier = best && best->audio ? best->qualityTier.value_or(result->tier) : result->tier;

    if (inWindow(index) || _waiters.contains(index))
        (void) _table.offer(index, audio, tier);

    deliver(index, audio);
    if (current)
        pump();
}

void PlaybackBufferManager::deliver(int index, const Result<AudioHandle>& audio)
{
    auto const it = _waiters.find(index);
    if (it == _waiters.end())
        return;
    auto callbacks = std::move(it->second);
    _waiters.erase(it);
    for (auto const& callback: callbacks)
        callback(index, audio);
}

void PlaybackBufferManager::failAllWaiters(const Error& error)
{
    auto waiters = std::exchange(_waiters, {});
    for (auto& [index, callbacks]: waiters)
        for (auto& callback: callbacks)
            _loop.post([callback = std::move(callback), index, error] { callback(index, std::unexpected(error)); });
}

auto PlaybackBufferManager::prefetchInFlight() const -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(_inFlight, [](auto const& entry) { return !entry.second; }));
}

auto PlaybackBufferManager::inWindow(int index) const -> bool
{
    return index >= _cursor - _options.evictTrail && index <= _cursor + _options.lookahead;
}

} // namespace narrator
