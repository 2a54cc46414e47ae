// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioOutput.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <vector>

namespace narrator
{

struct MiniaudioOutput::Impl
{
    ma_device device {};
    bool initialized = false;
    bool deviceRunning = false;
    unsigned deviceRate = 0;

    // Clip state, guarded by mutex
    std::mutex mutex;
    AudioHandle clip;
    std::vector<float> samples;
    unsigned clipRate = 0;
    double readPos = 0.0; ///< Fractional position in clip frames.
    double speed = 1.0;
    bool playing = false;
    FinishedCallback onFinished;

    [[nodiscard]] auto step() const -> double
    {
        return deviceRate == 0 ? 0.0 : speed * static_cast<double>(clipRate) / static_cast<double>(deviceRate);
    }

    /// @brief Returns the linearly interpolated sample at readPos.
    [[nodiscard]] auto interpolatedSample() const -> float
    {
        auto const index = static_cast<std::size_t>(readPos);
        auto const frac = static_cast<float>(readPos - static_cast<double>(index));
        auto const a = samples[index];
        auto const b = index + 1 < samples.size() ? samples[index + 1] : 0.0f;
        return a + (b - a) * frac;
    }

    auto load(const AudioHandle& newClip) -> VoidResult
    {
        if (!newClip)
            return makeError(ErrorCode::AudioError, "No clip to play");
        auto decoded = decodeMonoSamples(newClip->bytes);
        if (!decoded)
            return std::unexpected(decoded.error());
        clip = newClip;
        samples = std::move(*decoded);
        clipRate = newClip->format.sampleRate;
        return {};
    }

    auto ensureRunning() -> VoidResult
    {
        if (deviceRunning)
            return {};
        auto const result = ma_device_start(&device);
        if (result != MA_SUCCESS)
            return makeError(ErrorCode::AudioError, std::format("Failed to start playback: {}", static_cast<int>(result)));
        deviceRunning = true;
        return {};
    }

    void halt()
    {
        if (deviceRunning)
        {
            ma_device_stop(&device);
            deviceRunning = false;
        }
    }
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioOutput::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;

        auto finished = AudioOutput::FinishedCallback {};
        {
            auto lock = std::lock_guard(impl->mutex);
            auto const step = impl->step();
            for (auto frame = ma_uint32 { 0 }; frame < frameCount; ++frame)
            {
                auto sample = 0.0f;
                if (impl->playing && impl->readPos < static_cast<double>(impl->samples.size()))
                {
                    sample = impl->interpolatedSample();
                    impl->readPos += step;
                    if (impl->readPos >= static_cast<double>(impl->samples.size()))
                    {
                        impl->playing = false;
                        finished = std::move(impl->onFinished);
                        impl->onFinished = {};
                    }
                }
                std::fill_n(out + static_cast<std::size_t>(frame) * channels, channels, sample);
            }
        }

        if (finished)
            finished();
    }

} // namespace

MiniaudioOutput::MiniaudioOutput(): _impl(std::make_unique<Impl>())
{
}

MiniaudioOutput::~MiniaudioOutput()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
}

auto MiniaudioOutput::initialize(unsigned sampleRate) -> VoidResult
{
    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = 1;
    config.sampleRate = sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();

    auto const result = ma_device_init(nullptr, &config, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    _impl->deviceRate = _impl->device.sampleRate;
    log::info("Audio output initialized ({}Hz, mono, f32)", _impl->deviceRate);
    return {};
}

auto MiniaudioOutput::play(AudioHandle clip, FinishedCallback onFinished) -> VoidResult
{
    auto finishedAtOnce = false;
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (auto loaded = _impl->load(clip); !loaded)
            return loaded;
        _impl->readPos = 0.0;

        // Nothing to hand to the device: the clip is over as soon as it starts.
        finishedAtOnce = _impl->samples.empty();
        if (finishedAtOnce)
        {
            _impl->playing = false;
            _impl->onFinished = {};
        }
        else
        {
            if (!_impl->initialized)
                return makeError(ErrorCode::AudioError, "Playback device not initialized");
            _impl->onFinished = std::move(onFinished);
            _impl->playing = true;
        }
    }

    if (finishedAtOnce)
    {
        if (onFinished)
            onFinished();
        return {};
    }
    return _impl->ensureRunning();
}

void MiniaudioOutput::pause()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->playing = false;
    }
    _impl->halt();
}

auto MiniaudioOutput::resume() -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (!_impl->clip)
            return makeError(ErrorCode::AudioError, "No clip to resume");
        if (_impl->readPos >= static_cast<double>(_impl->samples.size()))
            return {};
        _impl->playing = true;
    }
    return _impl->ensureRunning();
}

void MiniaudioOutput::stop()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->playing = false;
        _impl->onFinished = {};
        _impl->clip.reset();
        _impl->samples.clear();
        _impl->readPos = 0.0;
    }
    _impl->halt();
}

auto MiniaudioOutput::swap(AudioHandle clip) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->clip || _impl->samples.empty())
        return false;

    auto const fraction = _impl->readPos / static_cast<double>(_impl->samples.size());
    if (auto loaded = _impl->load(clip); !loaded)
    {
        log::warning("Cannot swap clip: {}", loaded.error().message);
        return false;
    }
    _impl->readPos = std::clamp(fraction, 0.0, 1.0) * static_cast<double>(_impl->samples.size());
    return true;
}

void MiniaudioOutput::setSpeed(double speed)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->speed = speed;
}

auto MiniaudioOutput::positionSeconds() const -> double
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->clipRate == 0 ? 0.0 : _impl->readPos / static_cast<double>(_impl->clipRate);
}

} // namespace narrator
