// SPDX-License-Identifier: Apache-2.0
#include <pipeline/SegmentAudioTable.hpp>
#include <pipeline/SegmentProgressTracker.hpp>

#include "TestFakes.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <format>
#include <set>
#include <vector>

using namespace narrator;
using Catch::Approx;

namespace
{

auto generated(int index, int tier, double seconds = 0.5) -> Segment
{
    auto segment = Segment { .index = index, .text = std::format("Sentence number {} is here.", index) };
    segment.audio = test::makeClip(seconds);
    segment.durationSeconds = seconds;
    segment.qualityTier = tier;
    return segment;
}

} // namespace

TEST_CASE("SegmentProgressTracker reports generation percentage", "[progress]")
{
    auto tracker = SegmentProgressTracker {};
    auto reports = std::vector<int> {};
    tracker.setListener([&](const ChapterId& chapter, int percentage) {
        CHECK(chapter == "ch1");
        reports.push_back(percentage);
    });

    tracker.initChapter("ch1", test::makeSegments(4));
    CHECK(tracker.percentage("ch1") == 0);

    CHECK(tracker.markSegmentGenerated("ch1", generated(0, 0)));
    CHECK(tracker.markSegmentGenerated("ch1", generated(2, 0)));
    CHECK(tracker.percentage("ch1") == 50);
    CHECK(tracker.isSegmentGenerated("ch1", 2));
    CHECK(!tracker.isSegmentGenerated("ch1", 1));
    CHECK(reports == std::vector<int> { 0, 25, 50 });

    auto const snapshot = tracker.snapshot("ch1");
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->totalSegments == 4);
    CHECK(snapshot->isGenerating);
    CHECK(snapshot->segmentTexts.at(3) == "Sentence number 3 is here.");
}

TEST_CASE("SegmentProgressTracker records a first generation only once", "[progress]")
{
    auto tracker = SegmentProgressTracker {};
    tracker.initChapter("ch1", test::makeSegments(2));

    CHECK(tracker.markSegmentGenerated("ch1", generated(0, 1)));
    CHECK(!tracker.markSegmentGenerated("ch1", generated(0, 0)));
    CHECK(tracker.segmentQuality("ch1", 0) == 1);
    CHECK(tracker.generatedSegment("ch1", 0)->qualityTier == 1);

    CHECK(!tracker.markSegmentGenerated("unknown", generated(0, 0)));
}

TEST_CASE("SegmentProgressTracker never lowers segment quality", "[progress]")
{
    auto tracker = SegmentProgressTracker {};
    tracker.initChapter("ch1", test::makeSegments(2));
    REQUIRE(tracker.markSegmentGenerated("ch1", generated(0, 0)));

    CHECK(tracker.upgradeSegment("ch1", generated(0, 2)));
    CHECK(tracker.segmentQuality("ch1", 0) == 2);

    CHECK(!tracker.upgradeSegment("ch1", generated(0, 1)));
    CHECK(!tracker.upgradeSegment("ch1", generated(0, 2)));
    CHECK(tracker.segmentQuality("ch1", 0) == 2);
    CHECK(tracker.generatedSegment("ch1", 0)->qualityTier == 2);

    tracker.updateSegmentQuality("ch1", 0, 1);
    CHECK(tracker.segmentQuality("ch1", 0) == 2);

    // Upgrades only apply to segments that were generated before.
    CHECK(!tracker.upgradeSegment("ch1", generated(1, 3)));
}

TEST_CASE("SegmentProgressTracker assigns cumulative start offsets", "[progress]")
{
    auto tracker = SegmentProgressTracker {};
    tracker.initChapter("ch1", test::makeSegments(3));
    REQUIRE(tracker.markSegmentGenerated("ch1", generated(2, 0, 2.0)));
    REQUIRE(tracker.markSegmentGenerated("ch1", generated(0, 0, 1.0)));
    REQUIRE(tracker.markSegmentGenerated("ch1", generated(1, 0, 1.5)));

    auto const segments = tracker.assignStartOffsets("ch1");
    REQUIRE(segments.size() == 3);
    CHECK(segments[0].index == 0);
    CHECK(*segments[0].startOffsetSeconds == Approx(0.0));
    CHECK(*segments[1].startOffsetSeconds == Approx(1.0));
    CHECK(*segments[2].startOffsetSeconds == Approx(2.5));
    CHECK(*tracker.generatedSegment("ch1", 2)->startOffsetSeconds == Approx(2.5));
}

TEST_CASE("SegmentProgressTracker tracks the fast pass cursor", "[progress]")
{
    auto tracker = SegmentProgressTracker {};
    tracker.initChapter("ch1", test::makeSegments(3));

    tracker.setProcessingIndex("ch1", 1);
    CHECK(tracker.snapshot("ch1")->processingIndex == 1);

    tracker.markChapterComplete("ch1");
    auto const snapshot = tracker.snapshot("ch1");
    CHECK(!snapshot->isGenerating);
    CHECK(snapshot->processingIndex == -1);

    tracker.clearChapter("ch1");
    CHECK(!tracker.snapshot("ch1"));
    CHECK(tracker.percentage("ch1") == 0);
}

TEST_CASE("SegmentProgressTracker hydrates from storage", "[progress]")
{
    auto store = test::MemorySegmentStore {};
    REQUIRE(store.putSegment("book", "ch1", generated(0, 2)).has_value());
    REQUIRE(store.putSegment("book", "ch1", generated(1, 0)).has_value());

    auto tracker = SegmentProgressTracker {};
    auto const loaded = tracker.loadFromStore(store, "book", "ch1", test::makeSegments(2));
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 2);
    CHECK(tracker.percentage("ch1") == 100);
    CHECK(tracker.segmentQuality("ch1", 0) == 2);
    CHECK(tracker.generatedSegment("ch1", 1)->audio != nullptr);
    CHECK(!tracker.snapshot("ch1")->isGenerating);

    auto const missing = tracker.loadFromStore(store, "book", "ch2", test::makeSegments(3));
    REQUIRE(missing.has_value());
    CHECK(*missing == 0);
    CHECK(tracker.snapshot("ch2")->totalSegments == 3);
    CHECK(tracker.percentage("ch2") == 0);
}

TEST_CASE("SegmentProgressTracker keeps gaps of a partially stored chapter pending", "[progress]")
{
    auto store = test::MemorySegmentStore {};
    REQUIRE(store.putSegment("book", "ch1", generated(0, 1)).has_value());
    REQUIRE(store.putSegment("book", "ch1", generated(1, 0)).has_value());
    REQUIRE(store.putSegment("book", "ch1", generated(3, 0)).has_value());

    auto tracker = SegmentProgressTracker {};
    auto const loaded = tracker.loadFromStore(store, "book", "ch1", test::makeSegments(5));
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 3);

    auto const snapshot = tracker.snapshot("ch1");
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->totalSegments == 5);
    CHECK(snapshot->isGenerating);
    CHECK(snapshot->generatedIndices == std::set<int> { 0, 1, 3 });
    CHECK(tracker.percentage("ch1") == 60);
    CHECK(tracker.segmentQuality("ch1", 0) == 1);
    CHECK(!tracker.isSegmentGenerated("ch1", 2));
    CHECK(!tracker.isSegmentGenerated("ch1", 4));
}

TEST_CASE("SegmentProgressTracker ignores stored segments whose text changed", "[progress]")
{
    auto store = test::MemorySegmentStore {};
    REQUIRE(store.putSegment("book", "ch1", generated(0, 0)).has_value());
    auto edited = generated(1, 2);
    edited.text = "An older wording of the sentence.";
    REQUIRE(store.putSegment("book", "ch1", edited).has_value());
    REQUIRE(store.putSegment("book", "ch1", generated(7, 0)).has_value());

    auto tracker = SegmentProgressTracker {};
    auto const loaded = tracker.loadFromStore(store, "book", "ch1", test::makeSegments(2));
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 1);
    CHECK(tracker.isSegmentGenerated("ch1", 0));
    CHECK(!tracker.isSegmentGenerated("ch1", 1));
    CHECK(!tracker.segmentQuality("ch1", 1).has_value());
    CHECK(tracker.percentage("ch1") == 50);
}

TEST_CASE("SegmentAudioTable keeps the best tier per segment", "[progress]")
{
    auto table = SegmentAudioTable {};
    auto const low = test::makeClip(0.5);
    auto const high = test::makeClip(0.5);

    CHECK(table.offer(3, low, 0));
    CHECK(table.offer(3, high, 2));
    CHECK(!table.offer(3, low, 1));
    CHECK(table.audio(3) == high);
    CHECK(table.tier(3) == 2);
    CHECK(!table.offer(4, nullptr, 3));
}

TEST_CASE("SegmentAudioTable drops its reference on replace and eviction", "[progress]")
{
    auto table = SegmentAudioTable {};
    auto first = test::makeClip(0.5);
    auto const weak = std::weak_ptr<const AudioClip>(first);

    table.replace(0, std::move(first), 0);
    table.replace(1, test::makeClip(0.5), 0);
    table.replace(2, test::makeClip(0.5), 0);
    CHECK(!weak.expired());

    table.replace(0, test::makeClip(0.5), 1);
    CHECK(weak.expired());

    CHECK(table.evictBefore(2) == 2);
    CHECK(table.indices() == std::vector<int> { 2 });
    CHECK(table.release(2));
    CHECK(!table.release(2));
    CHECK(table.size() == 0);
}
