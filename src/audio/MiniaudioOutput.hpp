// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioOutput.hpp>

#include <memory>

namespace narrator
{

/// @brief Plays clips through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. Clips are decoded to
/// mono float samples and resampled to the device rate by linear interpolation,
/// which also implements the speed setting.
class MiniaudioOutput final: public AudioOutput
{
  public:
    MiniaudioOutput();
    ~MiniaudioOutput() override;

    MiniaudioOutput(const MiniaudioOutput&) = delete;
    MiniaudioOutput& operator=(const MiniaudioOutput&) = delete;

    /// @brief Initializes the playback device.
    /// @param sampleRate Device sample rate in Hz (e.g. 22050).
    /// @return Success or an error.
    [[nodiscard]] auto initialize(unsigned sampleRate) -> VoidResult;

    [[nodiscard]] auto play(AudioHandle clip, FinishedCallback onFinished) -> VoidResult override;
    void pause() override;
    [[nodiscard]] auto resume() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto swap(AudioHandle clip) -> bool override;
    void setSpeed(double speed) override;
    [[nodiscard]] auto positionSeconds() const -> double override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
