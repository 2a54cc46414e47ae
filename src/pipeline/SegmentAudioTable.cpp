// SPDX-License-Identifier: Apache-2.0
#include "SegmentAudioTable.hpp"

#include <iterator>

namespace narrator
{

void SegmentAudioTable::replace(int index, AudioHandle audio, int tier)
{
    _entries.insert_or_assign(index, Entry { .audio = std::move(audio), .tier = tier });
}

auto SegmentAudioTable::offer(int index, AudioHandle audio, int tier) -> bool
{
    if (!audio)
        return false;
    auto const it = _entries.find(index);
    if (it != _entries.end() && it->second.tier >= tier)
        return false;
    replace(index, std::move(audio), tier);
    return true;
}

auto SegmentAudioTable::release(int index) -> bool
{
    return _entries.erase(index) > 0;
}

auto SegmentAudioTable::evictBefore(int index) -> std::size_t
{
    auto const end = _entries.lower_bound(index);
    auto const count = static_cast<std::size_t>(std::distance(_entries.begin(), end));
    _entries.erase(_entries.begin(), end);
    return count;
}

void SegmentAudioTable::clear()
{
    _entries.clear();
}

auto SegmentAudioTable::audio(int index) const -> AudioHandle
{
    auto const it = _entries.find(index);
    return it == _entries.end() ? nullptr : it->second.audio;
}

auto SegmentAudioTable::tier(int index) const -> std::optional<int>
{
    auto const it = _entries.find(index);
    if (it == _entries.end())
        return std::nullopt;
    return it->second.tier;
}

auto SegmentAudioTable::indices() const -> std::vector<int>
{
    auto result = std::vector<int> {};
    result.reserve(_entries.size());
    for (auto const& [index, entry]: _entries)
        result.push_back(index);
    return result;
}

} // namespace narrator
