// SPDX-License-Identifier: Apache-2.0
#include <text/SegmentSplitter.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace narrator;

TEST_CASE("splitIntoSegments splits sentences at punctuation before a capital", "[splitter]")
{
    auto const segments = splitIntoSegments("Hello world. This is a test.");

    REQUIRE(segments.size() == 2);
    CHECK(segments[0].text == "Hello world.");
    CHECK(segments[1].text == "This is a test.");
    CHECK(segments[0].index == 0);
    CHECK(segments[1].index == 1);
    CHECK(!segments[0].audio);
    CHECK(!segments[0].qualityTier);
}

TEST_CASE("splitIntoSegments keeps lowercase continuations together", "[splitter]")
{
    auto const segments = splitIntoSegments("Mr. smith arrived late. Then he left.");

    REQUIRE(segments.size() == 2);
    CHECK(segments[0].text == "Mr. smith arrived late.");
    CHECK(segments[1].text == "Then he left.");
}

TEST_CASE("splitIntoSegments does not split inside numbers", "[splitter]")
{
    auto const segments = splitIntoSegments("Pi is about 3.14 and that is fine.");

    REQUIRE(segments.size() == 1);
    CHECK(segments[0].text == "Pi is about 3.14 and that is fine.");
}

TEST_CASE("splitIntoSegments treats punctuation runs as one boundary", "[splitter]")
{
    auto const segments = splitIntoSegments("Wait... What?! Yes");

    REQUIRE(segments.size() == 3);
    CHECK(segments[0].text == "Wait...");
    CHECK(segments[1].text == "What?!");
    CHECK(segments[2].text == "Yes");
}

TEST_CASE("splitIntoSegments breaks at line ends and drops blank lines", "[splitter]")
{
    auto const segments = splitIntoSegments("Chapter One\n\n  First line. Second line.\r\nThird\n");

    REQUIRE(segments.size() == 4);
    CHECK(segments[0].text == "Chapter One");
    CHECK(segments[1].text == "First line.");
    CHECK(segments[2].text == "Second line.");
    CHECK(segments[3].text == "Third");
    for (auto i = 0; i < 4; ++i)
        CHECK(segments[static_cast<std::size_t>(i)].index == i);
}

TEST_CASE("splitIntoSegments of blank text yields nothing", "[splitter]")
{
    CHECK(splitIntoSegments("").empty());
    CHECK(splitIntoSegments("   \n\t\n  ").empty());
}

TEST_CASE("splitIntoSegments is deterministic", "[splitter]")
{
    auto const text = "One. Two! Three? four.\nFive";
    auto const first = splitIntoSegments(text);
    auto const second = splitIntoSegments(text);

    REQUIRE(first.size() == second.size());
    for (auto i = std::size_t { 0 }; i < first.size(); ++i)
        CHECK(first[i].text == second[i].text);
}

TEST_CASE("splitIntoSentences ends a sentence at the end of the line", "[splitter]")
{
    auto const sentences = splitIntoSentences("Done. ");

    REQUIRE(sentences.size() == 1);
    CHECK(sentences[0] == "Done.");
}

TEST_CASE("countWords counts whitespace separated words", "[splitter]")
{
    CHECK(countWords("") == 0);
    CHECK(countWords("   ") == 0);
    CHECK(countWords("one") == 1);
    CHECK(countWords("  one two\tthree\nfour ") == 4);
}
