// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Splits chapter text into sentence-like segments.
///
/// A segment ends at a line break, or at a run of sentence punctuation
/// (. ! ?) that is followed by whitespace and then either an uppercase letter
/// or the end of the text. Pieces are trimmed and empty pieces are dropped.
/// The result is deterministic and indexed contiguously from zero.
/// @param text Plain chapter text.
/// @return The segments, without audio.
[[nodiscard]] auto splitIntoSegments(std::string_view text) -> std::vector<Segment>;

/// @brief Splits a single line into sentences using the punctuation rule above.
[[nodiscard]] auto splitIntoSentences(std::string_view line) -> std::vector<std::string>;

/// @brief Counts whitespace-separated words.
[[nodiscard]] auto countWords(std::string_view text) -> int;

} // namespace narrator
