// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioClip.hpp>
#include <core/Error.hpp>

#include <functional>

namespace narrator
{

/// @brief Non-blocking sink that plays one clip at a time.
class AudioOutput
{
  public:
    /// @brief Invoked once when a clip has played to its end (not on stop or replacement).
    ///
    /// May be called from the audio thread.
    using FinishedCallback = std::function<void()>;

    virtual ~AudioOutput() = default;

    /// @brief Starts @p clip from the beginning, replacing whatever was loaded.
    ///
    /// A clip without samples finishes at once: @p onFinished runs before play() returns.
    [[nodiscard]] virtual auto play(AudioHandle clip, FinishedCallback onFinished) -> VoidResult = 0;

    /// @brief Suspends playback, keeping the clip and its position.
    virtual void pause() = 0;

    /// @brief Continues a paused clip.
    [[nodiscard]] virtual auto resume() -> VoidResult = 0;

    /// @brief Stops playback and releases the loaded clip.
    virtual void stop() = 0;

    /// @brief Replaces the loaded clip, continuing at the same relative position.
    /// @return False if no clip is loaded.
    [[nodiscard]] virtual auto swap(AudioHandle clip) -> bool = 0;

    /// @brief Sets the playback rate (1.0 = normal).
    virtual void setSpeed(double speed) = 0;

    /// @brief Returns the position within the loaded clip in seconds.
    [[nodiscard]] virtual auto positionSeconds() const -> double = 0;
};

} // namespace narrator
