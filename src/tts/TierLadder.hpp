// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Quality grades of the voice models in the catalog, cheapest first.
enum class VoiceQuality : std::uint8_t
{
    XLow,
    Low,
    Medium,
    High,
};

/// @brief Number of tiers in a ladder (one per VoiceQuality).
constexpr auto TierCount = 4;

/// @brief Converts a VoiceQuality to its catalog name ("x_low", "low", "medium", "high").
[[nodiscard]] auto voiceQualityToString(VoiceQuality quality) -> std::string_view;

/// @brief Parses a catalog quality name.
[[nodiscard]] auto parseVoiceQuality(std::string_view name) -> std::optional<VoiceQuality>;

/// @brief Reduces a language tag to its lowercase primary subtag ("en_US" -> "en").
[[nodiscard]] auto normalizeLanguageCode(std::string_view language) -> std::string;

/// @brief One voice model available to the engine.
struct VoiceInfo
{
    std::string key;       ///< Unique voice key, e.g. "en_US-lessac-medium".
    std::string language;  ///< Language tag, e.g. "en_US".
    VoiceQuality quality = VoiceQuality::Medium;
    std::string modelPath; ///< Path to the .onnx model.
    std::string engine = "piper";
};

/// @brief Per-language list of generator configurations, indexed by tier.
///
/// Tier t is backed by a voice of quality t; tiers without a voice are empty.
struct TierLadder
{
    std::vector<std::optional<TierConfig>> tiers;
    int maxAvailableTier = -1;

    /// @brief Returns the configuration of @p tier, or nullptr if it is absent.
    [[nodiscard]] auto at(int tier) const -> const TierConfig*;

    /// @brief Returns the nearest available tier at or below @p tier.
    [[nodiscard]] auto walkDown(int tier) const -> std::optional<int>;

    /// @brief Returns the lowest available tier at or above @p tier.
    [[nodiscard]] auto lowestFrom(int tier) const -> std::optional<int>;
};

/// @brief Builds the tier ladder for @p language from the voice catalog.
/// @return The ladder, or UnsupportedVoice if no voice speaks the language.
[[nodiscard]] auto resolveTierLadder(std::string_view language, std::span<const VoiceInfo> voices)
    -> Result<TierLadder>;

} // namespace narrator
