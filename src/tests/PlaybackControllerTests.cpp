// SPDX-License-Identifier: Apache-2.0
#include <pipeline/PlaybackController.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <vector>

using namespace narrator;
using namespace std::chrono_literals;
using Catch::Approx;

namespace
{

struct PlayerFixture
{
    test::FakeSpeechEngine engine;
    GenerationCoordinator coordinator { engine, CoordinatorOptions { .initialDelay = 1ms, .maxDelay = 5ms } };
    SegmentProgressTracker progress;
    test::MemorySegmentStore store;
    test::FakeAudioOutput output;

    std::mutex mutex;
    std::vector<PlaybackEvent> events;

    PlaybackController controller;

    PlayerFixture():
        controller(coordinator,
                   progress,
                   store,
                   output,
                   PlaybackOptions { .buffer = BufferOptions { .lookahead = 2, .evictTrail = 2 } })
    {
        controller.setListener([this](const PlaybackEvent& event) {
            auto lock = std::lock_guard(mutex);
            events.push_back(event);
        });
    }

    ~PlayerFixture() { engine.release(); }

    void load(int count, int startIndex = 0)
    {
        progress.initChapter("ch1", test::makeSegments(count));
        controller.loadChapter("book",
                               "ch1",
                               test::makeSegments(count),
                               GenerationTarget { .voice = { .engine = "piper", .voice = "low" }, .tier = 0 },
                               startIndex);
        controller.sync();
    }

    /// @brief Waits until the output has been asked to play @p count clips and is playing the last one.
    auto waitForPlays(std::size_t count) -> bool
    {
        return test::waitUntil([&] { return output.playCount() == count && output.isPlaying(); });
    }

    auto states() -> std::vector<PlaybackState>
    {
        auto lock = std::lock_guard(mutex);
        auto result = std::vector<PlaybackState> {};
        for (auto const& event: events)
            if (auto const* changed = std::get_if<StateChangedEvent>(&event))
                result.push_back(changed->state);
        return result;
    }

    template <typename T>
    auto eventsOf() -> std::vector<T>
    {
        auto lock = std::lock_guard(mutex);
        auto result = std::vector<T> {};
        for (auto const& event: events)
            if (auto const* typed = std::get_if<T>(&event))
                result.push_back(*typed);
        return result;
    }
};

} // namespace

TEST_CASE("PlaybackController parks a loaded chapter paused", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(4, 2);

    CHECK(fixture.controller.state() == PlaybackState::Paused);
    CHECK(fixture.controller.currentIndex() == 2);
    CHECK(fixture.states() == std::vector<PlaybackState> { PlaybackState::Loading, PlaybackState::Paused });
    CHECK(fixture.output.playCount() == 0);

    auto const segments = fixture.eventsOf<SegmentChangedEvent>();
    REQUIRE(segments.size() == 1);
    CHECK(segments.front().index == 2);
    CHECK(!fixture.eventsOf<DurationChangedEvent>().empty());
}

TEST_CASE("PlaybackController plays through to the end of the chapter", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(3);

    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(1));
    CHECK(fixture.controller.state() == PlaybackState::Playing);

    fixture.output.finish();
    REQUIRE(fixture.waitForPlays(2));
    CHECK(fixture.controller.currentIndex() == 1);

    fixture.output.finish();
    REQUIRE(fixture.waitForPlays(3));
    CHECK(fixture.controller.currentIndex() == 2);

    fixture.output.finish();
    REQUIRE(test::waitUntil([&] { return fixture.controller.state() == PlaybackState::Ended; }));
    CHECK(fixture.output.clip() == nullptr);
    CHECK(fixture.states().back() == PlaybackState::Ended);

    // Playing an ended chapter starts over.
    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(4));
    CHECK(fixture.controller.currentIndex() == 0);
    CHECK(fixture.controller.state() == PlaybackState::Playing);
}

TEST_CASE("PlaybackController buffers while the cursor segment is generated", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.engine.block();
    fixture.load(3);

    fixture.controller.play();
    fixture.controller.sync();
    CHECK(fixture.controller.state() == PlaybackState::Playing);
    CHECK(fixture.controller.cursor().isBuffering);
    CHECK(fixture.output.playCount() == 0);

    fixture.engine.release();
    REQUIRE(fixture.waitForPlays(1));
    fixture.controller.sync();
    CHECK(!fixture.controller.cursor().isBuffering);

    auto const buffering = fixture.eventsOf<BufferingChangedEvent>();
    REQUIRE(buffering.size() == 2);
    CHECK(buffering[0].buffering);
    CHECK(!buffering[1].buffering);
}

TEST_CASE("PlaybackController pauses when generation of the cursor segment is cancelled", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.engine.block();
    fixture.load(3);

    fixture.controller.play();
    fixture.controller.sync();
    REQUIRE(fixture.controller.cursor().isBuffering);
    REQUIRE(test::waitUntil([&] { return fixture.engine.calls() >= 1; }));

    fixture.coordinator.cancelAll();
    REQUIRE(test::waitUntil([&] { return fixture.controller.state() == PlaybackState::Paused; }));
    CHECK(!fixture.controller.cursor().isBuffering);
    CHECK(fixture.eventsOf<PlaybackErrorEvent>().empty());
}

TEST_CASE("PlaybackController pause and play resume the loaded clip", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(3);
    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(1));

    fixture.controller.pause();
    fixture.controller.sync();
    CHECK(fixture.controller.state() == PlaybackState::Paused);
    CHECK(!fixture.output.isPlaying());

    fixture.controller.toggle();
    fixture.controller.sync();
    CHECK(fixture.controller.state() == PlaybackState::Playing);
    CHECK(fixture.output.resumes() == 1);
    CHECK(fixture.output.playCount() == 1);
}

TEST_CASE("PlaybackController skips between segments", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(4);
    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(1));

    fixture.controller.skipNext();
    REQUIRE(fixture.waitForPlays(2));
    CHECK(fixture.controller.currentIndex() == 1);

    fixture.controller.skipPrevious();
    REQUIRE(fixture.waitForPlays(3));
    CHECK(fixture.controller.currentIndex() == 0);

    fixture.controller.pause();
    fixture.controller.seekToSegment(3);
    fixture.controller.seekToSegment(9);
    fixture.controller.sync();
    CHECK(fixture.controller.state() == PlaybackState::Paused);
    CHECK(fixture.controller.currentIndex() == 3);
    CHECK(fixture.output.playCount() == 3);
}

TEST_CASE("PlaybackController swaps in an upgrade of the audible segment", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(3);
    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(1));

    auto upgraded = test::makeSegments(1).front();
    upgraded.audio = test::makeClip(0.5);
    upgraded.qualityTier = 2;
    fixture.controller.onSegmentUpgraded("ch1", upgraded);

    auto later = test::makeSegments(3).back();
    later.audio = test::makeClip(0.5);
    later.qualityTier = 1;
    fixture.controller.onSegmentUpgraded("ch1", later);
    fixture.controller.onSegmentUpgraded("other", upgraded);
    fixture.controller.sync();

    CHECK(fixture.output.swaps() == 1);
    CHECK(fixture.output.clip() == upgraded.audio);

    auto const events = fixture.eventsOf<SegmentUpgradedEvent>();
    REQUIRE(events.size() == 2);
    CHECK(events[0].index == 0);
    CHECK(events[0].tier == 2);
    CHECK(events[0].swapped);
    CHECK(events[1].index == 2);
    CHECK(!events[1].swapped);
}

TEST_CASE("PlaybackController clamps the playback speed", "[playback]")
{
    auto fixture = PlayerFixture {};

    fixture.controller.setSpeed(10.0);
    fixture.controller.sync();
    CHECK(fixture.output.speed() == Approx(4.0));
    CHECK(fixture.controller.cursor().speed == Approx(4.0));

    fixture.controller.setSpeed(0.1);
    fixture.controller.setSpeed(-1.0);
    fixture.controller.sync();
    CHECK(fixture.output.speed() == Approx(0.25));
    CHECK(fixture.controller.cursor().speed == Approx(0.25));
}

TEST_CASE("PlaybackController refines the duration from generated segments", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(2);

    auto first = test::makeSegments(1).front();
    first.audio = test::makeClip(0.5);
    fixture.controller.onSegmentGenerated("ch1", first);
    fixture.controller.sync();

    auto const durations = fixture.eventsOf<DurationChangedEvent>();
    REQUIRE(durations.size() == 2);
    CHECK(durations[0].seconds == Approx(3.75));
    CHECK(durations[1].seconds == Approx(2.375));
}

TEST_CASE("PlaybackController stop releases the chapter", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.load(3);
    fixture.controller.play();
    REQUIRE(fixture.waitForPlays(1));

    fixture.controller.stop();
    fixture.controller.sync();

    CHECK(fixture.controller.state() == PlaybackState::Stopped);
    CHECK(fixture.controller.currentIndex() == -1);
    CHECK(fixture.output.clip() == nullptr);

    // Nothing to play without a chapter.
    fixture.controller.play();
    fixture.controller.sync();
    CHECK(fixture.controller.state() == PlaybackState::Stopped);
}

TEST_CASE("PlaybackController reports output failures", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.output.failPlay(true);
    fixture.load(2);

    fixture.controller.play();
    REQUIRE(test::waitUntil([&] { return !fixture.eventsOf<PlaybackErrorEvent>().empty(); }));
    CHECK(fixture.controller.state() == PlaybackState::Stopped);
    CHECK(fixture.eventsOf<PlaybackErrorEvent>().front().error.code == ErrorCode::AudioError);
}

TEST_CASE("PlaybackController rejects an empty chapter", "[playback]")
{
    auto fixture = PlayerFixture {};
    fixture.controller.loadChapter("book", "empty", {}, GenerationTarget {}, 0);
    fixture.controller.sync();

    CHECK(fixture.controller.state() == PlaybackState::Stopped);
    auto const errors = fixture.eventsOf<PlaybackErrorEvent>();
    REQUIRE(errors.size() == 1);
    CHECK(errors.front().error.code == ErrorCode::InvalidArgument);
}
