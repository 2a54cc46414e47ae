// SPDX-License-Identifier: Apache-2.0
#include "DurationEstimator.hpp"

#include <text/SegmentSplitter.hpp>

#include <algorithm>

namespace narrator
{

DurationEstimator::DurationEstimator(double wordsPerMinute):
    _wordsPerSecond(wordsPerMinute > 0.0 ? wordsPerMinute / 60.0 : DefaultWordsPerMinute / 60.0)
{
}

void DurationEstimator::reset(std::span<const Segment> segments)
{
    _wordsPerSegment.clear();
    _wordsPerSegment.reserve(segments.size());
    for (auto const& segment: segments)
        _wordsPerSegment.push_back(countWords(segment.text));

    _totalWords = 0;
    for (auto const words: _wordsPerSegment)
        _totalWords += words;
    _measured.clear();
}

void DurationEstimator::recordMeasured(int index, double seconds)
{
    if (index < 0 || static_cast<std::size_t>(index) >= _wordsPerSegment.size() || seconds <= 0.0)
        return;
    _measured[index] = seconds;
}

auto DurationEstimator::estimateSeconds() const -> double
{
    auto measuredSeconds = 0.0;
    auto measuredWords = 0;
    for (auto const& [index, seconds]: _measured)
    {
        measuredSeconds += seconds;
        measuredWords += _wordsPerSegment[static_cast<std::size_t>(index)];
    }

    if (isComplete())
        return measuredSeconds;

    return measuredSeconds + secondsForWords(std::max(0, _totalWords - measuredWords));
}

auto DurationEstimator::secondsBefore(int index) const -> double
{
    auto seconds = 0.0;
    auto const end = std::min(static_cast<std::size_t>(std::max(index, 0)), _wordsPerSegment.size());
    for (auto i = std::size_t { 0 }; i < end; ++i)
    {
        auto const measured = _measured.find(static_cast<int>(i));
        seconds += measured != _measured.end() ? measured->second : secondsForWords(_wordsPerSegment[i]);
    }
    return seconds;
}

auto DurationEstimator::secondsForWords(int words) const -> double
{
    return static_cast<double>(words) / _wordsPerSecond;
}

} // namespace narrator
