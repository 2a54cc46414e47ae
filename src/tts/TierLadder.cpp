// SPDX-License-Identifier: Apache-2.0
#include "TierLadder.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace narrator
{

auto voiceQualityToString(VoiceQuality quality) -> std::string_view
{
    switch (quality)
    {
        case VoiceQuality::XLow: return "x_low";
        case VoiceQuality::Low: return "low";
        case VoiceQuality::Medium: return "medium";
        case VoiceQuality::High: return "high";
    }
    return "unknown";
}

auto parseVoiceQuality(std::string_view name) -> std::optional<VoiceQuality>
{
    if (name == "x_low")
        return VoiceQuality::XLow;
    if (name == "low")
        return VoiceQuality::Low;
    if (name == "medium")
        return VoiceQuality::Medium;
    if (name == "high")
        return VoiceQuality::High;
    return std::nullopt;
}

auto normalizeLanguageCode(std::string_view language) -> std::string
{
    auto const end = language.find_first_of("_-");
    auto primary = std::string(language.substr(0, end));
    std::ranges::transform(
        primary, primary.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return primary;
}

auto TierLadder::at(int tier) const -> const TierConfig*
{
    if (tier < 0 || static_cast<std::size_t>(tier) >= tiers.size() || !tiers[static_cast<std::size_t>(tier)])
        return nullptr;
    return &*tiers[static_cast<std::size_t>(tier)];
}

auto TierLadder::walkDown(int tier) const -> std::optional<int>
{
    for (auto t = std::min(tier, static_cast<int>(tiers.size()) - 1); t >= 0; --t)
        if (at(t))
            return t;
    return std::nullopt;
}

auto TierLadder::lowestFrom(int tier) const -> std::optional<int>
{
    for (auto t = std::max(tier, 0); t < static_cast<int>(tiers.size()); ++t)
        if (at(t))
            return t;
    return std::nullopt;
}

auto resolveTierLadder(std::string_view language, std::span<const VoiceInfo> voices) -> Result<TierLadder>
{
    auto const wanted = normalizeLanguageCode(language);
    auto ladder = TierLadder {};
    ladder.tiers.resize(TierCount);

    for (auto tier = 0; tier < TierCount; ++tier)
    {
        auto const quality = static_cast<VoiceQuality>(tier);
        auto const match = std::ranges::find_if(voices, [&](const VoiceInfo& voice) {
            return voice.quality == quality && normalizeLanguageCode(voice.language) == wanted;
        });
        if (match == voices.end())
            continue;

        ladder.tiers[static_cast<std::size_t>(tier)] = TierConfig {
            .engine = match->engine,
            .voice = match->key,
            .modelPath = match->modelPath,
            .quantization = "fp32",
            .device = "cpu",
        };
        ladder.maxAvailableTier = tier;
    }

    if (ladder.maxAvailableTier < 0)
        return makeError(ErrorCode::UnsupportedVoice, std::format("No voice available for language '{}'", language));

    return ladder;
}

} // namespace narrator
