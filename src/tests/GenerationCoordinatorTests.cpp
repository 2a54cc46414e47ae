// SPDX-License-Identifier: Apache-2.0
#include <tts/GenerationCoordinator.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using namespace narrator;
using namespace std::chrono_literals;

namespace
{

auto fastRetries() -> CoordinatorOptions
{
    return CoordinatorOptions {
        .requestTimeout = 5000ms,
        .maxInFlight = 50,
        .maxRetries = 3,
        .initialDelay = 1ms,
        .maxDelay = 5ms,
        .backoffMultiplier = 2.0,
    };
}

auto request(const std::string& text, int index = 0, bool urgent = false) -> GenerationRequest
{
    return GenerationRequest {
        .key = SegmentKey { "chapter-1", index },
        .text = text,
        .voice = TierConfig { .engine = "piper", .voice = "en_US-test-low" },
        .tier = 1,
        .urgent = urgent,
    };
}

auto settled(const GenerationCoordinator::Future& future) -> bool
{
    return future.wait_for(5s) == std::future_status::ready;
}

} // namespace

TEST_CASE("GenerationCoordinator produces audio at the requested tier", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto future = coordinator.generate(request("Hello there."));
    REQUIRE(settled(future));

    auto const& result = future.get();
    REQUIRE(result.has_value());
    CHECK(result->tier == 1);
    CHECK(result->attempts == 1);
    REQUIRE(result->audio);
    CHECK(result->audio->durationSeconds() > 0.0);
    CHECK(engine.texts() == std::vector<std::string> { "Hello there." });
    CHECK(engine.voices() == std::vector<std::string> { "en_US-test-low" });
    CHECK(coordinator.pendingCount() == 0);
}

TEST_CASE("GenerationCoordinator joins duplicate requests for one segment", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    engine.block();
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto first = coordinator.generate(request("Same segment."));
    REQUIRE(test::waitUntil([&] { return engine.calls() == 1; }));

    auto callbackFired = std::atomic<bool> { false };
    auto second = coordinator.generate(request("Same segment."));
    coordinator.generate(request("Same segment."), [&](const GenerationResult& result) {
        callbackFired = result.has_value();
    });
    CHECK(coordinator.pendingCount() == 1);
    CHECK(coordinator.isPending(SegmentKey { "chapter-1", 0 }));

    engine.release();
    REQUIRE(settled(first));
    REQUIRE(settled(second));

    REQUIRE(first.get().has_value());
    REQUIRE(second.get().has_value());
    CHECK(first.get()->audio == second.get()->audio);
    CHECK(test::waitUntil([&] { return callbackFired.load(); }));
    CHECK(engine.calls() == 1);
    CHECK(coordinator.stats().dispatches == 1);
}

TEST_CASE("GenerationCoordinator retries transient failures with an engine restart", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    engine.setScript([](const SynthesisRequest&, int call) -> Result<std::vector<std::uint8_t>> {
        if (call < 2)
            return makeError(ErrorCode::EngineError, "Failed to allocate memory for tensor");
        return test::makeWav(0.5);
    });
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto future = coordinator.generate(request("Retry me."));
    REQUIRE(settled(future));

    auto const& result = future.get();
    REQUIRE(result.has_value());
    CHECK(result->attempts == 3);
    CHECK(engine.calls() == 3);
    CHECK(engine.restarts() == 2);
    CHECK(coordinator.stats().restarts == 2);
}

TEST_CASE("GenerationCoordinator does not retry permanent failures", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    engine.setScript([](const SynthesisRequest&, int) -> Result<std::vector<std::uint8_t>> {
        return makeError(ErrorCode::EngineError, "Unknown phoneme");
    });
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto future = coordinator.generate(request("@@@"));
    REQUIRE(settled(future));

    auto const& result = future.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidInput);
    CHECK(engine.calls() == 1);
    CHECK(engine.restarts() == 0);
}

TEST_CASE("GenerationCoordinator gives up after the retry budget", "[coordinator]")
{
    auto options = fastRetries();
    options.maxRetries = 2;
    auto engine = test::FakeSpeechEngine {};
    engine.setScript([](const SynthesisRequest&, int) -> Result<std::vector<std::uint8_t>> {
        return makeError(ErrorCode::EngineError, "network unreachable");
    });
    auto coordinator = GenerationCoordinator(engine, options);

    auto future = coordinator.generate(request("Never works."));
    REQUIRE(settled(future));

    auto const& result = future.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NetworkError);
    CHECK(engine.calls() == 3);
}

TEST_CASE("GenerationCoordinator times out a stuck dispatch", "[coordinator]")
{
    auto options = fastRetries();
    options.requestTimeout = 20ms;
    options.maxRetries = 0;
    auto engine = test::FakeSpeechEngine {};
    engine.block();
    auto coordinator = GenerationCoordinator(engine, options);

    auto future = coordinator.generate(request("Slow segment."));
    REQUIRE(settled(future));

    auto const& result = future.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(coordinator.stats().timeouts == 1);
    engine.release();
}

TEST_CASE("GenerationCoordinator cancelAll fails every pending request", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    engine.block();
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto a = coordinator.generate(request("First.", 0));
    REQUIRE(test::waitUntil([&] { return engine.calls() == 1; }));
    auto b = coordinator.generate(request("Second.", 1));
    auto c = coordinator.generate(request("Third.", 2));
    CHECK(coordinator.pendingCount() == 3);

    coordinator.cancelAll();

    for (auto const* future: { &a, &b, &c })
    {
        REQUIRE(future->wait_for(0s) == std::future_status::ready);
        REQUIRE(!future->get().has_value());
        CHECK(future->get().error().code == ErrorCode::Cancelled);
    }
    CHECK(coordinator.pendingCount() == 0);

    // The interrupted engine is restarted before the next dispatch.
    engine.release();
    auto next = coordinator.generate(request("Fourth.", 3));
    REQUIRE(settled(next));
    CHECK(next.get().has_value());
    CHECK(engine.restarts() == 1);
}

TEST_CASE("GenerationCoordinator interrupts a synthesis cancelled while the engine warms up", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    auto coordinator = GenerationCoordinator(engine, fastRetries());
    auto cancelled = std::atomic<bool> { false };
    engine.setWarmUp([&] {
        if (!cancelled.exchange(true))
            coordinator.cancelAll();
    });

    auto first = coordinator.generate(request("First.", 0));
    REQUIRE(settled(first));
    auto const result = first.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
    REQUIRE(test::waitUntil([&] { return engine.interruptedCalls() == 1; }));

    // The interrupt is spent on the cancelled call only.
    auto second = coordinator.generate(request("Second.", 1));
    REQUIRE(settled(second));
    CHECK(second.get().has_value());
    CHECK(engine.interruptedCalls() == 1);
}

TEST_CASE("GenerationCoordinator clears a stale engine interrupt before dispatching", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    engine.interrupt();
    auto next = coordinator.generate(request("Hello.", 0));
    REQUIRE(settled(next));
    CHECK(next.get().has_value());
    CHECK(engine.interruptedCalls() == 0);
}

TEST_CASE("GenerationCoordinator rejects requests beyond the admission limit", "[coordinator]")
{
    auto options = fastRetries();
    options.maxInFlight = 2;
    auto engine = test::FakeSpeechEngine {};
    engine.block();
    auto coordinator = GenerationCoordinator(engine, options);

    auto a = coordinator.generate(request("One.", 0));
    auto b = coordinator.generate(request("Two.", 1));
    auto c = coordinator.generate(request("Three.", 2));

    REQUIRE(c.wait_for(0s) == std::future_status::ready);
    REQUIRE(!c.get().has_value());
    CHECK(c.get().error().code == ErrorCode::QueueFull);

    auto rejectedInline = false;
    coordinator.generate(request("Four.", 3), [&](const GenerationResult& result) {
        rejectedInline = !result.has_value() && result.error().code == ErrorCode::QueueFull;
    });
    CHECK(rejectedInline);
    CHECK(coordinator.stats().rejected == 2);

    engine.release();
    REQUIRE(settled(a));
    REQUIRE(settled(b));
    CHECK(a.get().has_value());
    CHECK(b.get().has_value());
}

TEST_CASE("GenerationCoordinator dispatches urgent requests first", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    engine.block();
    auto coordinator = GenerationCoordinator(engine, fastRetries());

    auto running = coordinator.generate(request("A", 0));
    REQUIRE(test::waitUntil([&] { return engine.calls() == 1; }));
    auto b = coordinator.generate(request("B", 1));
    auto c = coordinator.generate(request("C", 2));
    auto d = coordinator.generate(request("D", 3, true));
    CHECK(coordinator.prioritize(SegmentKey { "chapter-1", 2 }));
    CHECK(!coordinator.prioritize(SegmentKey { "chapter-1", 42 }));

    engine.release();
    REQUIRE(settled(b));
    REQUIRE(settled(c));
    REQUIRE(settled(d));
    CHECK(engine.texts() == std::vector<std::string> { "A", "C", "D", "B" });
}

TEST_CASE("GenerationCoordinator backoff grows geometrically up to the cap", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    auto coordinator = GenerationCoordinator(engine);

    CHECK(coordinator.backoffDelay(0) == 1000ms);
    CHECK(coordinator.backoffDelay(1) == 2000ms);
    CHECK(coordinator.backoffDelay(2) == 4000ms);
    CHECK(coordinator.backoffDelay(3) == 5000ms);
}

TEST_CASE("GenerationCoordinator refuses work after shutdown", "[coordinator]")
{
    auto engine = test::FakeSpeechEngine {};
    auto coordinator = GenerationCoordinator(engine);
    coordinator.shutdown();

    auto future = coordinator.generate(request("Too late."));
    REQUIRE(future.wait_for(0s) == std::future_status::ready);
    REQUIRE(!future.get().has_value());
    CHECK(future.get().error().code == ErrorCode::Cancelled);
}
