// SPDX-License-Identifier: Apache-2.0
#include <pipeline/PlaybackBufferManager.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace narrator;
using namespace std::chrono_literals;

namespace
{

auto coordinatorOptions() -> CoordinatorOptions
{
    return CoordinatorOptions { .initialDelay = 1ms, .maxDelay = 5ms };
}

/// @brief Buffer wired to a fake engine; every buffer call goes through the loop.
struct BufferFixture
{
    test::FakeSpeechEngine engine;
    GenerationCoordinator coordinator { engine, coordinatorOptions() };
    SegmentProgressTracker progress;
    test::MemorySegmentStore store;
    EventLoop loop { "buffer-test" };
    PlaybackBufferManager buffer;
    std::vector<Segment> segments;

    explicit BufferFixture(BufferOptions options = {}):
        buffer(loop, coordinator, progress, store, options)
    {
    }

    ~BufferFixture()
    {
        engine.release();
        loop.stop();
        coordinator.shutdown();
    }

    void load(int count)
    {
        segments = test::makeSegments(count);
        progress.initChapter("ch1", segments);
        loop.invoke([this] {
            buffer.loadChapter("book", "ch1", segments, GenerationTarget { .voice = { .voice = "low" }, .tier = 0 });
        });
    }

    void onLoop(const EventLoop::Task& task) { loop.invoke(task); }

    auto buffered() -> std::vector<int>
    {
        auto result = std::vector<int> {};
        loop.invoke([&] { result = buffer.bufferedIndices(); });
        return result;
    }

    auto inFlight() -> std::vector<int>
    {
        auto result = std::vector<int> {};
        loop.invoke([&] { result = buffer.inFlightIndices(); });
        return result;
    }

    auto queued() -> std::size_t
    {
        auto result = std::size_t { 0 };
        loop.invoke([&] { result = buffer.queuedCount(); });
        return result;
    }
};

auto generatedSegment(int index, int tier) -> Segment
{
    auto segment = test::makeSegments(index + 1).back();
    segment.audio = test::makeClip(0.5);
    segment.durationSeconds = 0.5;
    segment.qualityTier = tier;
    return segment;
}

} // namespace

TEST_CASE("PlaybackBufferManager prefetches the lookahead window", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 5, .evictTrail = 5, .maxParallelPrefetch = 5 });
    fixture.engine.block();
    fixture.load(12);

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });
    CHECK(fixture.inFlight() == std::vector<int> { 0, 1, 2, 3, 4 });
    CHECK(fixture.queued() == 1);

    // The cursor segment becomes urgent and leaves room for the rest of the window.
    auto delivered = std::atomic<bool> { false };
    fixture.onLoop([&] {
        fixture.buffer.request(0, [&](int index, const Result<AudioHandle>& audio) {
            delivered = index == 0 && audio.has_value() && *audio != nullptr;
        });
    });
    CHECK(fixture.inFlight() == std::vector<int> { 0, 1, 2, 3, 4, 5 });
    CHECK(fixture.queued() == 0);

    fixture.engine.release();
    REQUIRE(test::waitUntil([&] { return fixture.buffered() == std::vector<int> { 0, 1, 2, 3, 4, 5 }; }));
    CHECK(delivered);
    CHECK(fixture.engine.calls() == 6);
    CHECK(fixture.progress.isSegmentGenerated("ch1", 5));
    CHECK(fixture.inFlight().empty());
}

TEST_CASE("PlaybackBufferManager slides the window and evicts behind the cursor", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 5, .evictTrail = 5, .maxParallelPrefetch = 5 });
    fixture.load(12);

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });
    REQUIRE(test::waitUntil([&] { return fixture.buffered() == std::vector<int> { 0, 1, 2, 3, 4, 5 }; }));

    fixture.onLoop([&] { fixture.buffer.ensureWindow(8); });
    REQUIRE(test::waitUntil([&] { return fixture.buffered() == std::vector<int> { 3, 4, 5, 8, 9, 10, 11 }; }));

    fixture.onLoop([&] { fixture.buffer.ensureWindow(11); });
    CHECK(fixture.buffered() == std::vector<int> { 8, 9, 10, 11 });
    CHECK(fixture.engine.calls() == 10);
}

TEST_CASE("PlaybackBufferManager reuses audio from the progress record", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 0 });
    fixture.load(3);
    REQUIRE(fixture.progress.markSegmentGenerated("ch1", generatedSegment(0, 1)));

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });

    CHECK(fixture.buffered() == std::vector<int> { 0 });
    auto tier = std::optional<int> {};
    fixture.onLoop([&] { tier = fixture.buffer.tierAt(0); });
    CHECK(tier == 1);
    CHECK(fixture.engine.calls() == 0);
}

TEST_CASE("PlaybackBufferManager reloads released segments from storage", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 0 });
    fixture.load(3);
    auto const stored = generatedSegment(1, 2);
    REQUIRE(fixture.store.putSegment("book", "ch1", stored).has_value());

    auto received = AudioHandle {};
    fixture.onLoop([&] {
        fixture.buffer.request(1, [&](int, const Result<AudioHandle>& audio) {
            if (audio)
                received = *audio;
        });
    });
    fixture.onLoop([] {});

    CHECK(received == stored.audio);
    CHECK(fixture.engine.calls() == 0);
    CHECK(fixture.progress.isSegmentGenerated("ch1", 1));
    auto tier = std::optional<int> {};
    fixture.onLoop([&] { tier = fixture.buffer.tierAt(1); });
    CHECK(tier == 2);
}

TEST_CASE("PlaybackBufferManager does not generate an in-flight segment twice", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 2 });
    fixture.engine.block();
    fixture.load(5);

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });
    REQUIRE(test::waitUntil([&] { return fixture.engine.calls() == 1; }));

    auto delivered = std::atomic<int> { 0 };
    fixture.onLoop([&] {
        fixture.buffer.request(2, [&](int index, const Result<AudioHandle>& audio) {
            if (index == 2 && audio)
                ++delivered;
        });
    });

    fixture.engine.release();
    REQUIRE(test::waitUntil([&] { return delivered == 1; }));
    REQUIRE(test::waitUntil([&] { return fixture.buffered().size() == 3; }));
    CHECK(fixture.engine.calls() == 3);
    CHECK(fixture.coordinator.stats().dispatches == 3);
}

TEST_CASE("PlaybackBufferManager rejects requests outside the chapter", "[buffer]")
{
    auto fixture = BufferFixture();
    fixture.load(2);

    auto code = std::optional<ErrorCode> {};
    fixture.onLoop([&] {
        fixture.buffer.request(7, [&](int, const Result<AudioHandle>& audio) {
            if (!audio)
                code = audio.error().code;
        });
    });
    fixture.onLoop([] {});

    CHECK(code == ErrorCode::InvalidArgument);
}

TEST_CASE("PlaybackBufferManager cancelGeneration fails waiting requests", "[buffer]")
{
    auto fixture = BufferFixture();
    fixture.engine.block();
    fixture.load(4);

    auto results = std::vector<ErrorCode> {};
    fixture.onLoop([&] {
        fixture.buffer.request(0, [&](int, const Result<AudioHandle>& audio) {
            results.push_back(audio ? ErrorCode::Unknown : audio.error().code);
        });
    });
    REQUIRE(test::waitUntil([&] { return fixture.engine.calls() == 1; }));

    fixture.onLoop([&] { fixture.buffer.cancelGeneration(); });
    fixture.onLoop([] {});

    auto snapshot = std::vector<ErrorCode> {};
    fixture.onLoop([&] { snapshot = results; });
    CHECK(snapshot == std::vector<ErrorCode> { ErrorCode::Cancelled });
    CHECK(fixture.inFlight().empty());
    CHECK(fixture.coordinator.pendingCount() == 0);
}

TEST_CASE("PlaybackBufferManager clearPendingPrefetch keeps in-flight work", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 5, .maxParallelPrefetch = 2 });
    fixture.engine.block();
    fixture.load(10);

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });
    CHECK(fixture.inFlight() == std::vector<int> { 0, 1 });
    CHECK(fixture.queued() == 4);

    fixture.onLoop([&] { fixture.buffer.clearPendingPrefetch(); });
    CHECK(fixture.queued() == 0);
    CHECK(fixture.inFlight() == std::vector<int> { 0, 1 });
}

TEST_CASE("PlaybackBufferManager installs upgrades only for buffered segments", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 0 });
    fixture.load(3);
    REQUIRE(fixture.progress.markSegmentGenerated("ch1", generatedSegment(0, 0)));
    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });

    auto const better = test::makeClip(0.5);
    auto installed = false;
    auto ignored = true;
    auto downgraded = true;
    fixture.onLoop([&] {
        installed = fixture.buffer.offer(0, better, 2);
        downgraded = fixture.buffer.offer(0, test::makeClip(0.5), 1);
        ignored = fixture.buffer.offer(2, better, 2);
    });

    CHECK(installed);
    CHECK(!downgraded);
    CHECK(!ignored);
    auto audio = AudioHandle {};
    fixture.onLoop([&] { audio = fixture.buffer.audioAt(0); });
    CHECK(audio == better);
}

TEST_CASE("PlaybackBufferManager unloadChapter drops buffered audio and late results", "[buffer]")
{
    auto fixture = BufferFixture(BufferOptions { .lookahead = 1 });
    fixture.engine.block();
    fixture.load(4);

    fixture.onLoop([&] { fixture.buffer.ensureWindow(0); });
    REQUIRE(test::waitUntil([&] { return fixture.engine.calls() == 1; }));

    fixture.onLoop([&] { fixture.buffer.unloadChapter(); });
    CHECK(fixture.inFlight().empty());

    fixture.engine.release();
    REQUIRE(test::waitUntil([&] { return fixture.coordinator.pendingCount() == 0; }));
    std::this_thread::sleep_for(50ms);

    CHECK(fixture.buffered().empty());
    CHECK(!fixture.progress.isSegmentGenerated("ch1", 0));
}
