// SPDX-License-Identifier: Apache-2.0
#include <core/EventLoop.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

using namespace narrator;
using namespace std::chrono_literals;

TEST_CASE("EventLoop runs posted tasks in order", "[eventloop]")
{
    auto loop = EventLoop("test");
    auto mutex = std::mutex {};
    auto order = std::vector<int> {};

    for (auto i = 0; i < 5; ++i)
        loop.post([&, i] {
            auto lock = std::lock_guard(mutex);
            order.push_back(i);
        });
    loop.invoke([] {});

    auto lock = std::lock_guard(mutex);
    CHECK(order == std::vector<int> { 0, 1, 2, 3, 4 });
}

TEST_CASE("EventLoop runs delayed tasks after immediate ones", "[eventloop]")
{
    auto loop = EventLoop("test");
    auto mutex = std::mutex {};
    auto order = std::vector<int> {};
    auto record = [&](int value) {
        auto lock = std::lock_guard(mutex);
        order.push_back(value);
    };

    (void) loop.postDelayed(30ms, [&] { record(2); });
    loop.post([&] { record(1); });

    REQUIRE(test::waitUntil([&] {
        auto lock = std::lock_guard(mutex);
        return order.size() == 2;
    }));
    auto lock = std::lock_guard(mutex);
    CHECK(order == std::vector<int> { 1, 2 });
}

TEST_CASE("EventLoop cancel removes a pending timer", "[eventloop]")
{
    auto loop = EventLoop("test");
    auto fired = std::atomic<bool> { false };

    auto const id = loop.postDelayed(50ms, [&] { fired = true; });
    CHECK(loop.cancel(id));
    CHECK(!loop.cancel(id));

    std::this_thread::sleep_for(100ms);
    CHECK(!fired);
}

TEST_CASE("EventLoop invoke runs inline on the loop thread", "[eventloop]")
{
    auto loop = EventLoop("test");
    auto inner = false;

    loop.invoke([&] {
        CHECK(loop.isLoopThread());
        loop.invoke([&] { inner = true; });
    });
    CHECK(inner);
    CHECK(!loop.isLoopThread());
}

TEST_CASE("EventLoop handle stops posting after the loop is stopped", "[eventloop]")
{
    auto loop = EventLoop("test");
    auto const handle = loop.handle();

    CHECK(handle.post([] {}));
    loop.stop();
    CHECK(!handle.post([] {}));
    CHECK(loop.postDelayed(1ms, [] {}) == 0);
}
