// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioClip.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tts/SpeechEngine.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace narrator
{

/// @brief Tunables of the GenerationCoordinator.
struct CoordinatorOptions
{
    std::chrono::milliseconds requestTimeout { 120'000 }; ///< Budget of a single dispatch.
    std::size_t maxInFlight = 50;                        ///< Admission ceiling for pending requests.
    int maxRetries = 3;                                  ///< Retries after the first attempt.
    std::chrono::milliseconds initialDelay { 1000 };
    std::chrono::milliseconds maxDelay { 5000 };
    double backoffMultiplier = 2.0;
};

/// @brief A segment to synthesize at a given tier.
struct GenerationRequest
{
    SegmentKey key;
    std::string text;
    TierConfig voice;
    int tier = 0;
    bool urgent = false; ///< Dispatch ahead of queued requests (playback underrun).
};

/// @brief Successful generation outcome.
struct GeneratedAudio
{
    AudioHandle audio;
    int tier = 0;     ///< Tier the audio was produced at.
    int attempts = 0; ///< Number of dispatches it took.
};

using GenerationResult = Result<GeneratedAudio>;

/// @brief Counters exposed for diagnostics and tests.
struct CoordinatorStats
{
    std::size_t dispatches = 0; ///< Calls into SpeechEngine::synthesize().
    std::size_t restarts = 0;   ///< Engine restarts performed.
    std::size_t timeouts = 0;   ///< Attempts that exceeded the request timeout.
    std::size_t rejected = 0;   ///< Requests refused by queue admission.
};

/// @brief Serializes segment synthesis onto a single engine.
///
/// Requests are deduplicated per segment key: a second request for a key that
/// is still pending joins the first one. Each dispatch is bounded by the request
/// timeout; retryable failures are re-dispatched after an exponential backoff,
/// and memory failures restart the engine before the next dispatch.
///
/// Completion callbacks are invoked without internal locks held, from the
/// engine worker thread, the timer thread, or the thread calling cancelAll().
class GenerationCoordinator
{
  public:
    using Completion = std::function<void(const GenerationResult&)>;
    using Future = std::shared_future<GenerationResult>;

    /// @brief Starts the worker thread.
    /// @param engine The engine to drive. Must outlive the coordinator.
    /// @param options Timeout, admission and retry settings.
    explicit GenerationCoordinator(SpeechEngine& engine, CoordinatorOptions options = {});
    ~GenerationCoordinator();

    GenerationCoordinator(const GenerationCoordinator&) = delete;
    GenerationCoordinator& operator=(const GenerationCoordinator&) = delete;

    /// @brief Requests synthesis of a segment.
    /// @param request The segment, its text and its voice.
    /// @return A future resolving to the audio or the final error.
    auto generate(GenerationRequest request) -> Future;

    /// @brief Requests synthesis of a segment and reports the outcome through a callback.
    ///
    /// A request rejected by admission invokes @p onDone before returning.
    void generate(GenerationRequest request, Completion onDone);

    /// @brief Fails every pending request with a Cancelled error before returning.
    ///
    /// Interrupts the running dispatch and restarts the engine before the next one.
    void cancelAll();

    /// @brief Cancels all pending work and stops the worker thread.
    void shutdown();

    /// @brief Moves a queued request ahead of all others.
    /// @return False if no request for @p key is pending.
    auto prioritize(const SegmentKey& key) -> bool;

    /// @brief Returns true if a request for @p key is pending.
    [[nodiscard]] auto isPending(const SegmentKey& key) const -> bool;

    /// @brief Returns the number of pending requests.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    [[nodiscard]] auto stats() const -> CoordinatorStats;

    /// @brief Returns the backoff delay before retry number @p retry (zero-based).
    [[nodiscard]] auto backoffDelay(int retry) const -> std::chrono::milliseconds;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
