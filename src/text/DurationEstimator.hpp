// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <map>
#include <span>
#include <vector>

namespace narrator
{

/// @brief Estimates chapter duration before (and while) audio is generated.
///
/// Unmeasured segments are estimated from their word count at a fixed
/// speaking rate; measured segments contribute their real duration. Once every
/// segment has been measured the estimate equals the measured sum.
class DurationEstimator
{
  public:
    static constexpr auto DefaultWordsPerMinute = 160.0;

    explicit DurationEstimator(double wordsPerMinute = DefaultWordsPerMinute);

    /// @brief Starts a new chapter, forgetting previous measurements.
    void reset(std::span<const Segment> segments);

    /// @brief Records the real duration of a generated segment.
    void recordMeasured(int index, double seconds);

    /// @brief Returns the current chapter duration estimate in seconds.
    [[nodiscard]] auto estimateSeconds() const -> double;

    /// @brief Returns the time from the chapter start to the start of segment @p index.
    [[nodiscard]] auto secondsBefore(int index) const -> double;

    /// @brief Returns the heuristic duration of @p words words.
    [[nodiscard]] auto secondsForWords(int words) const -> double;

    [[nodiscard]] auto totalWords() const -> int { return _totalWords; }
    [[nodiscard]] auto measuredCount() const -> std::size_t { return _measured.size(); }
    [[nodiscard]] auto isComplete() const -> bool
    {
        return !_wordsPerSegment.empty() && _measured.size() == _wordsPerSegment.size();
    }

  private:
    double _wordsPerSecond;
    std::vector<int> _wordsPerSegment;
    int _totalWords = 0;
    std::map<int, double> _measured;
};

} // namespace narrator
