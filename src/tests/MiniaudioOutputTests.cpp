// SPDX-License-Identifier: Apache-2.0
#include <audio/MiniaudioOutput.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace narrator;

// These run without opening a playback device.

TEST_CASE("MiniaudioOutput finishes a clip without samples at once", "[output]")
{
    auto output = MiniaudioOutput {};
    auto finished = 0;

    auto const played = output.play(test::makeClip(0.0), [&] { ++finished; });

    REQUIRE(played.has_value());
    CHECK(finished == 1);
    CHECK(output.positionSeconds() == 0.0);
}

TEST_CASE("MiniaudioOutput needs a device for audible clips", "[output]")
{
    auto output = MiniaudioOutput {};
    auto finished = 0;

    auto const played = output.play(test::makeClip(0.5), [&] { ++finished; });

    REQUIRE(!played.has_value());
    CHECK(played.error().code == ErrorCode::AudioError);
    CHECK(finished == 0);
    CHECK(!output.play(nullptr, {}).has_value());
}
