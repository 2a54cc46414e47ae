// SPDX-License-Identifier: Apache-2.0
#include "MediaSession.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <type_traits>
#include <variant>
#include <vector>

namespace narrator
{

namespace
{

    auto splitWords(std::string_view line) -> std::vector<std::string_view>
    {
        auto words = std::vector<std::string_view> {};
        auto pos = std::size_t { 0 };
        while (pos < line.size())
        {
            auto const start = line.find_first_not_of(" \t\r\n", pos);
            if (start == std::string_view::npos)
                break;
            auto const end = line.find_first_of(" \t\r\n", start);
            words.push_back(line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
            pos = end == std::string_view::npos ? line.size() : end;
        }
        return words;
    }

    template <typename T>
    auto parseNumber(std::string_view text) -> std::optional<T>
    {
        auto value = T {};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

} // namespace

auto parseMediaCommand(std::string_view line) -> Result<MediaCommand>
{
    auto const words = splitWords(line);
    if (words.empty())
        return MediaCommand { .action = MediaAction::Status };

    auto const verb = words.front();
    auto const simple = [&](MediaAction action) -> Result<MediaCommand> {
        if (words.size() != 1)
            return makeError(ErrorCode::InvalidArgument, std::format("'{}' takes no argument", verb));
        return MediaCommand { .action = action };
    };

    if (verb == "play")
        return simple(MediaAction::Play);
    if (verb == "pause")
        return simple(MediaAction::Pause);
    if (verb == "toggle" || verb == "p")
        return simple(MediaAction::Toggle);
    if (verb == "next" || verb == "n")
        return simple(MediaAction::Next);
    if (verb == "previous" || verb == "prev" || verb == "b")
        return simple(MediaAction::Previous);
    if (verb == "stop")
        return simple(MediaAction::Stop);
    if (verb == "status" || verb == "s")
        return simple(MediaAction::Status);

    if (verb == "seek" || verb == "goto")
    {
        if (words.size() != 2)
            return makeError(ErrorCode::InvalidArgument, "Usage: seek <segment number>");
        auto const number = parseNumber<int>(words[1]);
        if (!number || *number < 1)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid segment number: {}", words[1]));
        return MediaCommand { .action = MediaAction::SeekToSegment, .segment = *number - 1 };
    }

    if (verb == "speed")
    {
        if (words.size() != 2)
            return makeError(ErrorCode::InvalidArgument, "Usage: speed <rate>");
        auto const rate = parseNumber<double>(words[1]);
        if (!rate || !std::isfinite(*rate) || *rate <= 0.0)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid speed: {}", words[1]));
        return MediaCommand { .action = MediaAction::SetSpeed, .speed = *rate };
    }

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown command: {}", verb));
}

auto formatClock(double seconds) -> std::string
{
    auto const total = static_cast<long>(std::max(0.0, std::floor(seconds)));
    auto const hours = total / 3600;
    auto const minutes = (total / 60) % 60;
    auto const secs = total % 60;
    if (hours > 0)
        return std::format("{}:{:02}:{:02}", hours, minutes, secs);
    return std::format("{}:{:02}", minutes, secs);
}

MediaSession::MediaSession(PlaybackController& controller): _controller(controller)
{
}

void MediaSession::setMetadata(MediaMetadata metadata)
{
    auto lock = std::lock_guard(_mutex);
    _metadata = std::move(metadata);
}

void MediaSession::execute(const MediaCommand& command)
{
    switch (command.action)
    {
        case MediaAction::Play: _controller.play(); break;
        case MediaAction::Pause: _controller.pause(); break;
        case MediaAction::Toggle: _controller.toggle(); break;
        case MediaAction::Next: _controller.skipNext(); break;
        case MediaAction::Previous: _controller.skipPrevious(); break;
        case MediaAction::SeekToSegment: _controller.seekToSegment(command.segment); break;
        case MediaAction::SetSpeed: _controller.setSpeed(command.speed); break;
        case MediaAction::Stop: _controller.stop(); break;
        case MediaAction::Status: break;
    }
}

void MediaSession::observe(const PlaybackEvent& event)
{
    auto lock = std::lock_guard(_mutex);
    std::visit(
        [this](auto const& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StateChangedEvent>)
            {
                _state = e.state;
                _cursor.isPlaying = e.state == PlaybackState::Playing;
                if (e.state == PlaybackState::Playing)
                    _lastError.reset();
            }
            else if constexpr (std::is_same_v<T, SegmentChangedEvent>)
                _cursor.currentSegmentIndex = e.index;
            else if constexpr (std::is_same_v<T, BufferingChangedEvent>)
                _cursor.isBuffering = e.buffering;
            else if constexpr (std::is_same_v<T, PositionChangedEvent>)
                _cursor = e.cursor;
            else if constexpr (std::is_same_v<T, DurationChangedEvent>)
                _cursor.durationSeconds = e.seconds;
            else if constexpr (std::is_same_v<T, PlaybackErrorEvent>)
                _lastError = e.error;
        },
        event);
}

auto MediaSession::positionState() const -> MediaPositionState
{
    auto lock = std::lock_guard(_mutex);
    return MediaPositionState {
        .durationSeconds = _cursor.durationSeconds,
        .positionSeconds = std::min(_cursor.currentTimeSeconds, _cursor.durationSeconds),
        .playbackRate = _cursor.speed,
    };
}

auto MediaSession::playbackState() const -> PlaybackState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto MediaSession::lastError() const -> std::optional<Error>
{
    auto lock = std::lock_guard(_mutex);
    return _lastError;
}

auto MediaSession::renderStatus() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    auto status = std::format("[{}] {}", playbackStateToString(_state), _metadata.chapter);
    if (_cursor.currentSegmentIndex >= 0)
        status += std::format("  segment {}/{}", _cursor.currentSegmentIndex + 1, _metadata.segmentCount);
    status += std::format("  {} / {}",
                          formatClock(std::min(_cursor.currentTimeSeconds, _cursor.durationSeconds)),
                          formatClock(_cursor.durationSeconds));
    if (_cursor.speed != 1.0)
        status += std::format("  x{:.2g}", _cursor.speed);
    if (_cursor.isBuffering)
        status += "  (buffering)";
    if (_lastError)
        status += std::format("  error: {}", _lastError->message);
    return status;
}

} // namespace narrator
