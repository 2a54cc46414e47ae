// SPDX-License-Identifier: Apache-2.0
#include "GenerationCoordinator.hpp"

#include <core/EventLoop.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace narrator
{

namespace
{

    struct PendingRequest
    {
        GenerationRequest request;
        std::promise<GenerationResult> promise;
        GenerationCoordinator::Future future;
        std::vector<GenerationCoordinator::Completion> callbacks;
        int attempts = 0;
        std::uint64_t attemptId = 0; ///< Id of the live attempt or backoff timer; 0 if none.
        EventLoop::TimerId timer = 0;
        bool finished = false;
    };

    using PendingPtr = std::shared_ptr<PendingRequest>;

    /// @brief Deferred promise fulfilment, run after the coordinator lock is released.
    using Settlement = std::function<void()>;

    auto readyFuture(GenerationResult result) -> GenerationCoordinator::Future
    {
        auto promise = std::promise<GenerationResult> {};
        promise.set_value(std::move(result));
        return promise.get_future().share();
    }

} // namespace

struct GenerationCoordinator::Impl
{
    SpeechEngine& engine;
    CoordinatorOptions options;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<SegmentKey, PendingPtr> pending;
    std::deque<PendingPtr> ready;
    std::uint64_t nextAttemptId = 1;
    std::uint64_t runningAttempt = 0;
    bool restartRequested = false;
    bool shutdownRequested = false;
    CoordinatorStats stats;

    EventLoop timers { "generation-timers" };
    std::jthread worker;

    Impl(SpeechEngine& engine, CoordinatorOptions options): engine(engine), options(options) {}

    [[nodiscard]] auto backoffDelay(int retry) const -> std::chrono::milliseconds
    {
        auto const scaled = static_cast<double>(options.initialDelay.count())
                            * std::pow(options.backoffMultiplier, static_cast<double>(std::max(retry, 0)));
        auto const capped = std::min(scaled, static_cast<double>(options.maxDelay.count()));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
    }

    auto submit(GenerationRequest request, Completion onDone) -> Future
    {
        auto rejection = std::optional<Error> {};
        auto future = Future {};
        {
            auto lock = std::lock_guard(mutex);
            if (shutdownRequested)
                rejection = Error { ErrorCode::Cancelled, "Generation coordinator is shut down" };
            else if (auto const it = pending.find(request.key); it != pending.end())
            {
                log::trace("Joining pending generation of {}", request.key);
                if (onDone)
                    it->second->callbacks.push_back(std::move(onDone));
                if (request.urgent)
                    promote(it->second);
                return it->second->future;
            }
            else if (pending.size() >= options.maxInFlight)
            {
                ++stats.rejected;
                rejection = Error { ErrorCode::QueueFull,
                                    std::format("Generation queue is full ({} requests in flight)", pending.size()) };
            }
            else
            {
                auto entry = std::make_shared<PendingRequest>();
                entry->future = entry->promise.get_future().share();
                if (onDone)
                    entry->callbacks.push_back(std::move(onDone));
                auto const key = request.key;
                entry->request = std::move(request);
                future = entry->future;
                pending.emplace(key, entry);
                if (entry->request.urgent)
                    ready.push_front(std::move(entry));
                else
                    ready.push_back(std::move(entry));
                cv.notify_one();
                return future;
            }
        }

        log::warning("Rejected generation of {}: {}", request.key, rejection->message);
        auto result = GenerationResult { std::unexpected(*rejection) };
        if (onDone)
            onDone(result);
        return readyFuture(std::move(result));
    }

    /// @brief Moves a queued request to the front of the dispatch queue. Requires the lock.
    void promote(const PendingPtr& entry)
    {
        entry->request.urgent = true;
        auto const it = std::ranges::find(ready, entry);
        if (it == ready.end() || it == ready.begin())
            return;
        ready.erase(it);
        ready.push_front(entry);
    }

    /// @brief Marks @p entry finished and returns the deferred fulfilment. Requires the lock.
    auto settle(const PendingPtr& entry, GenerationResult result) -> Settlement
    {
        entry->finished = true;
        entry->attemptId = 0;
        if (entry->timer != 0)
        {
            timers.cancel(entry->timer);
            entry->timer = 0;
        }
        if (auto const it = pending.find(entry->request.key); it != pending.end() && it->second == entry)
            pending.erase(it);

        return [entry, result = std::move(result)]() mutable {
            entry->promise.set_value(result);
            for (auto const& callback: entry->callbacks)
                callback(result);
        };
    }

    /// @brief Settles a failed attempt or schedules its retry. Requires the lock.
    auto handleFailure(const PendingPtr& entry, Error error) -> Settlement
    {
        auto const& key = entry->request.key;
        if (!isRetryable(error) || entry->attempts > options.maxRetries)
        {
            if (errorKind(error.code) != ErrorKind::Cancellation)
                log::warning("Generation of {} failed after {} attempt(s): {}", key, entry->attempts, error);
            return settle(entry, std::unexpected(std::move(error)));
        }

        if (isMemoryError(error))
            restartRequested = true;

        auto const delay = backoffDelay(entry->attempts - 1);
        auto const id = nextAttemptId++;
        entry->attemptId = id;
        entry->timer = timers.postDelayed(delay, [this, entry, id] { requeue(entry, id); });
        if (entry->timer == 0)
            return settle(entry, makeError(ErrorCode::Cancelled, "Generation coordinator is shut down"));

        log::info("Retrying generation of {} in {} ms (attempt {}/{}): {}",
                  key,
                  delay.count(),
                  entry->attempts + 1,
                  options.maxRetries + 1,
                  error.message);
        return {};
    }

    void requeue(const PendingPtr& entry, std::uint64_t id)
    {
        auto lock = std::lock_guard(mutex);
        if (entry->finished || entry->attemptId != id)
            return;
        entry->timer = 0;
        if (entry->request.urgent)
            ready.push_front(entry);
        else
            ready.push_back(entry);
        cv.notify_one();
    }

    void onTimeout(const PendingPtr& entry, std::uint64_t id)
    {
        auto settlement = Settlement {};
        {
            auto lock = std::lock_guard(mutex);
            if (entry->finished || entry->attemptId != id)
                return;
            entry->timer = 0;
            ++stats.timeouts;
            if (runningAttempt == id)
                engine.interrupt();
            settlement = handleFailure(entry,
                                       Error { ErrorCode::TimeoutError,
                                               std::format("Generation of {} timed out after {} ms",
                                                           entry->request.key,
                                                           options.requestTimeout.count()) });
        }
        if (settlement)
            settlement();
    }

    /// @brief Worker thread function that dispatches ready requests to the engine.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto entry = PendingPtr {};
            auto restart = false;
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !ready.empty() || shutdownRequested; });
                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                entry = std::move(ready.front());
                ready.pop_front();
                if (entry->finished)
                    continue;
                restart = std::exchange(restartRequested, false);
            }

            if (restart && !restartEngine(entry))
                continue;

            dispatch(entry);
        }
    }

    /// @brief Restarts the engine; on failure settles or retries @p entry.
    /// @return True if the engine is ready for the next dispatch.
    auto restartEngine(const PendingPtr& entry) -> bool
    {
        log::info("Restarting speech engine");
        auto restarted = engine.restart();

        auto settlement = Settlement {};
        {
            auto lock = std::lock_guard(mutex);
            if (restarted)
            {
                ++stats.restarts;
                return true;
            }

            restartRequested = true;
            log::error("Speech engine restart failed: {}", restarted.error());
            if (!entry->finished)
            {
                ++entry->attempts;
                settlement = handleFailure(entry, restarted.error());
            }
        }
        if (settlement)
            settlement();
        return false;
    }

    void dispatch(const PendingPtr& entry)
    {
        auto synthesis = SynthesisRequest {};
        auto id = std::uint64_t {};
        {
            auto lock = std::lock_guard(mutex);
            if (entry->finished)
                return;
            ++entry->attempts;
            ++stats.dispatches;
            id = nextAttemptId++;
            entry->attemptId = id;
            engine.resetInterrupt();
            runningAttempt = id;
            entry->timer =
                timers.postDelayed(options.requestTimeout, [this, entry, id] { onTimeout(entry, id); });
            synthesis = SynthesisRequest { .text = entry->request.text, .voice = entry->request.voice };
            log::debug("Dispatching {} at tier {} (attempt {})", entry->request.key, entry->request.tier, entry->attempts);
        }

        auto clip = engine.synthesize(synthesis).and_then(
            [](std::vector<std::uint8_t>&& bytes) { return makeAudioClip(std::move(bytes)); });

        auto settlement = Settlement {};
        {
            auto lock = std::lock_guard(mutex);
            runningAttempt = 0;
            if (entry->finished || entry->attemptId != id)
            {
                log::debug("Discarding stale result for {}", entry->request.key);
                return;
            }
            if (entry->timer != 0)
            {
                timers.cancel(entry->timer);
                entry->timer = 0;
            }

            if (clip)
                settlement = settle(entry,
                                    GeneratedAudio {
                                        .audio = std::move(*clip),
                                        .tier = entry->request.tier,
                                        .attempts = entry->attempts,
                                    });
            else
                settlement = handleFailure(
                    entry,
                    normalizeEngineError(std::move(clip.error()), std::format("Synthesis of {}", entry->request.key)));
        }
        if (settlement)
            settlement();
    }

    void cancelAll()
    {
        auto settlements = std::vector<Settlement> {};
        {
            auto lock = std::lock_guard(mutex);
            auto victims = std::exchange(pending, {});
            ready.clear();
            for (auto const& [key, entry]: victims)
                settlements.push_back(settle(entry, makeError(ErrorCode::Cancelled, "Generation cancelled")));

            if (runningAttempt != 0)
            {
                engine.interrupt();
                restartRequested = true;
            }
        }

        if (!settlements.empty())
            log::debug("Cancelled {} pending generation(s)", settlements.size());
        for (auto const& settlement: settlements)
            settlement();
    }
};

GenerationCoordinator::GenerationCoordinator(SpeechEngine& engine, CoordinatorOptions options):
    _impl(std::make_unique<Impl>(engine, options))
{
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

GenerationCoordinator::~GenerationCoordinator()
{
    shutdown();
}

auto GenerationCoordinator::generate(GenerationRequest request) -> Future
{
    return _impl->submit(std::move(request), {});
}

void GenerationCoordinator::generate(GenerationRequest request, Completion onDone)
{
    (void) _impl->submit(std::move(request), std::move(onDone));
}

void GenerationCoordinator::cancelAll()
{
    _impl->cancelAll();
}

void GenerationCoordinator::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
    }

    _impl->cancelAll();

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
    }
    _impl->cv.notify_all();
    _impl->engine.interrupt();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
    _impl->timers.stop();
}

auto GenerationCoordinator::prioritize(const SegmentKey& key) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->pending.find(key);
    if (it == _impl->pending.end())
        return false;
    _impl->promote(it->second);
    return true;
}

auto GenerationCoordinator::isPending(const SegmentKey& key) const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->pending.contains(key);
}

auto GenerationCoordinator::pendingCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->pending.size();
}

auto GenerationCoordinator::stats() const -> CoordinatorStats
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->stats;
}

auto GenerationCoordinator::backoffDelay(int retry) const -> std::chrono::milliseconds
{
    return _impl->backoffDelay(retry);
}

} // namespace narrator
