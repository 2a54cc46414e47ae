// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/PlaybackController.hpp>
#include <pipeline/PlaybackEvent.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace narrator
{

/// @brief Host media controls understood by the session.
enum class MediaAction : std::uint8_t
{
    Play,
    Pause,
    Toggle,
    Next,
    Previous,
    SeekToSegment,
    SetSpeed,
    Stop,
    Status,
};

/// @brief One host command with its argument.
struct MediaCommand
{
    MediaAction action = MediaAction::Status;
    int segment = 0;    ///< Zero-based target of SeekToSegment.
    double speed = 1.0; ///< Rate of SetSpeed.
};

/// @brief Parses a command line such as "play", "seek 12" or "speed 1.5".
///
/// Segment numbers are one-based on the command line, as shown to the listener.
[[nodiscard]] auto parseMediaCommand(std::string_view line) -> Result<MediaCommand>;

/// @brief Position report in the shape host media sessions expect.
struct MediaPositionState
{
    double durationSeconds = 0.0;
    double positionSeconds = 0.0;
    double playbackRate = 1.0;
};

/// @brief What is being played.
struct MediaMetadata
{
    std::string book;
    std::string chapter;
    int segmentCount = 0;
};

/// @brief Formats seconds as m:ss, or h:mm:ss from one hour on.
[[nodiscard]] auto formatClock(double seconds) -> std::string;

/// @brief Adapter between a host media integration and the playback controller.
///
/// Commands are forwarded to transport verbs; playback events are folded into a
/// position report and a one-line status. observe() may be called from the
/// playback thread while status accessors are used elsewhere.
class MediaSession
{
  public:
    explicit MediaSession(PlaybackController& controller);

    void setMetadata(MediaMetadata metadata);

    /// @brief Forwards @p command to the matching transport verb.
    void execute(const MediaCommand& command);

    /// @brief Folds a playback event into the session state.
    void observe(const PlaybackEvent& event);

    [[nodiscard]] auto positionState() const -> MediaPositionState;
    [[nodiscard]] auto playbackState() const -> PlaybackState;
    [[nodiscard]] auto lastError() const -> std::optional<Error>;

    /// @brief Renders e.g. "[playing] Chapter 1  segment 3/12  0:12 / 3:40".
    [[nodiscard]] auto renderStatus() const -> std::string;

  private:
    PlaybackController& _controller;

    mutable std::mutex _mutex;
    MediaMetadata _metadata;
    PlaybackState _state = PlaybackState::Stopped;
    PlaybackCursor _cursor;
    std::optional<Error> _lastError;
};

} // namespace narrator
