// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

namespace narrator
{

/// @brief Top-level states of the playback state machine.
///
/// Buffering is not a state of its own: it is reported through
/// PlaybackCursor::isBuffering while the state is Playing.
enum class PlaybackState : std::uint8_t
{
    Stopped,
    Loading,
    Playing,
    Paused,
    Ended,
};

[[nodiscard]] constexpr auto playbackStateToString(PlaybackState state) -> std::string_view
{
    switch (state)
    {
        case PlaybackState::Stopped: return "stopped";
        case PlaybackState::Loading: return "loading";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Ended: return "ended";
    }
    return "unknown";
}

/// @brief Read-only position signal for the presentation layer.
struct PlaybackCursor
{
    int currentSegmentIndex = -1;
    double segmentTimeSeconds = 0.0; ///< Position within the current segment.
    double currentTimeSeconds = 0.0; ///< Position within the chapter.
    double durationSeconds = 0.0;    ///< Chapter duration, estimated until every segment is measured.
    double speed = 1.0;
    bool isPlaying = false;
    bool isBuffering = false;
};

/// @brief The state machine moved to a new state.
struct StateChangedEvent
{
    PlaybackState state {};
};

/// @brief The cursor entered another segment.
struct SegmentChangedEvent
{
    int index = 0;
};

/// @brief Playback started or stopped waiting for audio.
struct BufferingChangedEvent
{
    bool buffering = false;
};

/// @brief Periodic position report while playing, and after every jump.
struct PositionChangedEvent
{
    PlaybackCursor cursor;
};

/// @brief The chapter duration estimate changed.
struct DurationChangedEvent
{
    double seconds = 0.0;
};

/// @brief A segment of the loaded chapter got higher-tier audio.
struct SegmentUpgradedEvent
{
    int index = 0;
    int tier = 0;
    bool swapped = false; ///< True if it replaced audio that was audible at that moment.
};

/// @brief Playback stopped because of a failure.
struct PlaybackErrorEvent
{
    Error error;
};

/// @brief Discriminated union of everything the playback controller reports.
using PlaybackEvent = std::variant<StateChangedEvent,
                                   SegmentChangedEvent,
                                   BufferingChangedEvent,
                                   PositionChangedEvent,
                                   DurationChangedEvent,
                                   SegmentUpgradedEvent,
                                   PlaybackErrorEvent>;

} // namespace narrator
