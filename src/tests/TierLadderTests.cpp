// SPDX-License-Identifier: Apache-2.0
#include <tts/TierLadder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace narrator;

namespace
{

auto voice(std::string key, std::string language, VoiceQuality quality) -> VoiceInfo
{
    auto info = VoiceInfo {
        .key = std::move(key),
        .language = std::move(language),
        .quality = quality,
    };
    info.modelPath = "/voices/" + info.key + ".onnx";
    return info;
}

auto catalog() -> std::vector<VoiceInfo>
{
    return {
        voice("en_US-lessac-low", "en_US", VoiceQuality::Low),
        voice("en_US-lessac-medium", "en_US", VoiceQuality::Medium),
        voice("en_GB-alba-high", "en_GB", VoiceQuality::High),
        voice("de_DE-thorsten-x_low", "de_DE", VoiceQuality::XLow),
    };
}

} // namespace

TEST_CASE("voice quality names round-trip", "[tiers]")
{
    for (auto const quality: { VoiceQuality::XLow, VoiceQuality::Low, VoiceQuality::Medium, VoiceQuality::High })
        CHECK(parseVoiceQuality(voiceQualityToString(quality)) == quality);
    CHECK(!parseVoiceQuality("ultra"));
}

TEST_CASE("normalizeLanguageCode keeps the lowercase primary subtag", "[tiers]")
{
    CHECK(normalizeLanguageCode("en_US") == "en");
    CHECK(normalizeLanguageCode("EN-gb") == "en");
    CHECK(normalizeLanguageCode("de") == "de");
}

TEST_CASE("resolveTierLadder maps voice qualities onto tiers", "[tiers]")
{
    auto const voices = catalog();
    auto const ladder = resolveTierLadder("en", voices);

    REQUIRE(ladder.has_value());
    REQUIRE(ladder->tiers.size() == TierCount);
    CHECK(ladder->at(0) == nullptr);
    REQUIRE(ladder->at(1) != nullptr);
    CHECK(ladder->at(1)->voice == "en_US-lessac-low");
    CHECK(ladder->at(1)->engine == "piper");
    CHECK(ladder->at(1)->modelPath == "/voices/en_US-lessac-low.onnx");
    REQUIRE(ladder->at(2) != nullptr);
    CHECK(ladder->at(2)->voice == "en_US-lessac-medium");
    REQUIRE(ladder->at(3) != nullptr);
    CHECK(ladder->at(3)->voice == "en_GB-alba-high");
    CHECK(ladder->maxAvailableTier == 3);
}

TEST_CASE("resolveTierLadder rejects unknown languages", "[tiers]")
{
    auto const voices = catalog();
    auto const ladder = resolveTierLadder("fr_FR", voices);

    REQUIRE(!ladder.has_value());
    CHECK(ladder.error().code == ErrorCode::UnsupportedVoice);
}

TEST_CASE("TierLadder walks to the nearest available tier", "[tiers]")
{
    auto const voices = catalog();
    auto const ladder = resolveTierLadder("en", voices);
    REQUIRE(ladder.has_value());

    CHECK(ladder->lowestFrom(0) == 1);
    CHECK(ladder->lowestFrom(2) == 2);
    CHECK(!ladder->lowestFrom(4));
    CHECK(ladder->walkDown(3) == 3);
    CHECK(ladder->walkDown(9) == 3);
    CHECK(!ladder->walkDown(0));
    CHECK(ladder->at(-1) == nullptr);
    CHECK(ladder->at(TierCount) == nullptr);
}

TEST_CASE("TierLadder with a single voice uses it for every tier request", "[tiers]")
{
    auto const voices = std::vector<VoiceInfo> { voice("de_DE-thorsten-x_low", "de_DE", VoiceQuality::XLow) };
    auto const ladder = resolveTierLadder("de", voices);

    REQUIRE(ladder.has_value());
    CHECK(ladder->maxAvailableTier == 0);
    CHECK(ladder->lowestFrom(0) == 0);
    CHECK(ladder->walkDown(2) == 0);
    CHECK(!ladder->lowestFrom(1));
}
