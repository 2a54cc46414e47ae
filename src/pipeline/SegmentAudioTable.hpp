// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioClip.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace narrator
{

/// @brief Audio handles held by playback, keyed by segment index.
///
/// Every handle stored here is one reference owned by playback. Replacing or
/// evicting an entry drops that reference exactly once. Not thread-safe.
class SegmentAudioTable
{
  public:
    struct Entry
    {
        AudioHandle audio;
        int tier = 0;
    };

    /// @brief Stores @p audio for @p index, releasing the previous handle.
    void replace(int index, AudioHandle audio, int tier);

    /// @brief Stores @p audio if the index is empty or held at a lower tier.
    /// @return True if the entry changed.
    auto offer(int index, AudioHandle audio, int tier) -> bool;

    /// @brief Releases the handle of @p index.
    auto release(int index) -> bool;

    /// @brief Releases every handle below @p index.
    /// @return The number of released handles.
    auto evictBefore(int index) -> std::size_t;

    void clear();

    [[nodiscard]] auto audio(int index) const -> AudioHandle;
    [[nodiscard]] auto tier(int index) const -> std::optional<int>;
    [[nodiscard]] auto contains(int index) const -> bool { return _entries.contains(index); }
    [[nodiscard]] auto size() const -> std::size_t { return _entries.size(); }
    [[nodiscard]] auto indices() const -> std::vector<int>;

  private:
    std::map<int, Entry> _entries;
};

} // namespace narrator
