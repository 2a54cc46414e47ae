// SPDX-License-Identifier: Apache-2.0
#include "SegmentSplitter.hpp"

#include <cctype>

namespace narrator
{

namespace
{

    auto isSpace(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto isSentenceEnd(char c) -> bool
    {
        return c == '.' || c == '!' || c == '?';
    }

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return text;
    }

} // namespace

auto splitIntoSentences(std::string_view line) -> std::vector<std::string>
{
    auto sentences = std::vector<std::string> {};
    auto start = std::size_t { 0 };
    auto pos = std::size_t { 0 };

    while (pos < line.size())
    {
        if (!isSentenceEnd(line[pos]))
        {
            ++pos;
            continue;
        }

        auto punctEnd = pos;
        while (punctEnd < line.size() && isSentenceEnd(line[punctEnd]))
            ++punctEnd;

        auto next = punctEnd;
        while (next < line.size() && isSpace(line[next]))
            ++next;

        auto const hasGap = next > punctEnd;
        auto const boundary =
            hasGap && (next == line.size() || std::isupper(static_cast<unsigned char>(line[next])) != 0);

        if (boundary)
        {
            auto const sentence = trim(line.substr(start, punctEnd - start));
            if (!sentence.empty())
                sentences.emplace_back(sentence);
            start = next;
        }
        pos = next > punctEnd ? next : punctEnd;
    }

    if (start < line.size())
    {
        auto const rest = trim(line.substr(start));
        if (!rest.empty())
            sentences.emplace_back(rest);
    }

    return sentences;
}

auto splitIntoSegments(std::string_view text) -> std::vector<Segment>
{
    auto segments = std::vector<Segment> {};

    while (!text.empty())
    {
        auto const eol = text.find('\n');
        auto line = text.substr(0, eol);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        for (auto& sentence: splitIntoSentences(line))
            segments.push_back(Segment { .index = static_cast<int>(segments.size()), .text = std::move(sentence) });

        if (eol == std::string_view::npos)
            break;
        text.remove_prefix(eol + 1);
    }

    return segments;
}

auto countWords(std::string_view text) -> int
{
    auto words = 0;
    auto inWord = false;
    for (auto const c: text)
    {
        if (isSpace(c))
            inWord = false;
        else if (!inWord)
        {
            inWord = true;
            ++words;
        }
    }
    return words;
}

} // namespace narrator
