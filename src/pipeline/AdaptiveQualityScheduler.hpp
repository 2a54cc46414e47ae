// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <library/SegmentStore.hpp>
#include <pipeline/ResourceMonitor.hpp>
#include <pipeline/SegmentProgressTracker.hpp>
#include <tts/GenerationCoordinator.hpp>
#include <tts/TierLadder.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Timing and candidate selection of the background upgrade loop.
struct SchedulerOptions
{
    std::chrono::milliseconds startDelay { 5000 }; ///< Delay before the first upgrade tick.
    std::chrono::milliseconds interval { 5000 };   ///< Delay between upgrade ticks.
    int horizon = 10;                              ///< Upcoming segments considered per tick.
    bool upgradePlayed = true;                     ///< Also upgrade segments behind the cursor.
};

/// @brief Life cycle of a chapter in the scheduler.
enum class SchedulerState : std::uint8_t
{
    Idle,
    FastPass,
    UpgradeLoop,
    Cancelled,
    Exhausted,
};

[[nodiscard]] auto schedulerStateToString(SchedulerState state) -> std::string_view;

/// @brief Two-pass generation: everything at the cheapest tier first, then upgrades in the background.
///
/// The fast pass runs on its own thread and generates segments in order. The
/// upgrade loop runs one non-overlapping tick at a time on a timer thread,
/// upgrading one segment by one ladder step per tick.
class AdaptiveQualityScheduler
{
  public:
    /// @brief Receives a segment produced by either pass.
    using SegmentCallback = std::function<void(const ChapterId& chapter, const Segment& segment)>;
    /// @brief Invoked when the fast pass has gone through every segment of a chapter.
    using ChapterCallback = std::function<void(const ChapterId& chapter)>;
    /// @brief Returns the playback cursor of a chapter.
    using CursorProvider = std::function<int()>;

    AdaptiveQualityScheduler(GenerationCoordinator& coordinator,
                             ResourceMonitor& monitor,
                             SegmentProgressTracker& progress,
                             SegmentStore& store,
                             SchedulerOptions options = {});
    ~AdaptiveQualityScheduler();

    AdaptiveQualityScheduler(const AdaptiveQualityScheduler&) = delete;
    AdaptiveQualityScheduler& operator=(const AdaptiveQualityScheduler&) = delete;

    /// @brief Generates every segment at the lowest usable tier, in index order.
    ///
    /// Segments already recorded in the progress tracker are reused. Per-segment
    /// failures are logged and skipped. When the pass is through, start offsets are
    /// assigned, segments and the assembled chapter audio are stored and the
    /// chapter is marked complete. A previous pass for the same chapter is cancelled.
    /// @return The tier used, or an error if the ladder has no usable tier.
    auto startFastPass(BookId book,
                       ChapterId chapter,
                       std::vector<Segment> segments,
                       const TierLadder& ladder,
                       SegmentCallback onSegmentReady,
                       ChapterCallback onComplete = {}) -> Result<int>;

    /// @brief Stops the fast pass of a chapter. Safe to call when none runs.
    void cancelFastPass(const ChapterId& chapter);

    /// @brief Blocks until the fast pass of @p chapter has ended.
    void waitForFastPass(const ChapterId& chapter);

    /// @brief Starts the upgrade loop of a chapter, replacing an existing one.
    ///
    /// The loop may start while the fast pass is still running. It only ends
    /// as exhausted once the fast pass is over and nothing is left to upgrade.
    /// @return False if the ladder offers nothing above tier 0 for this device.
    auto scheduleUpgradePass(BookId book,
                             ChapterId chapter,
                             const TierLadder& ladder,
                             CursorProvider currentIndex,
                             SegmentCallback onSegmentUpgraded) -> bool;

    /// @brief Stops the upgrade loop of a chapter. Idempotent.
    void cancelUpgrade(const ChapterId& chapter);

    /// @brief Cancels every pass of every chapter.
    void cancelAll();

    [[nodiscard]] auto state(const ChapterId& chapter) const -> SchedulerState;

    /// @brief Returns the highest tier the upgrade loop aims for on this device and ladder.
    [[nodiscard]] auto effectiveTarget(const TierLadder& ladder) const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
