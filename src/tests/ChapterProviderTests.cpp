// SPDX-License-Identifier: Apache-2.0
#include <library/ChapterProvider.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace narrator;

namespace
{

auto makeBook(const std::string& name) -> std::filesystem::path
{
    auto const dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "02-storm.txt") << "The Storm\n\nRain fell. The wind rose.\n";
    std::ofstream(dir / "01-harbor.txt") << "\n   \n  The Harbor  \r\nShips came in.\n";
    std::ofstream(dir / "notes.md") << "Not a chapter.\n";
    return dir;
}

} // namespace

TEST_CASE("DirectoryChapterProvider lists text files in name order", "[chapters]")
{
    auto const dir = makeBook("narrator_book_list");
    auto provider = DirectoryChapterProvider(dir);

    auto const chapters = provider.chapters();
    REQUIRE(chapters.has_value());
    REQUIRE(chapters->size() == 2);
    CHECK(chapters->at(0).id == "01-harbor");
    CHECK(chapters->at(0).title == "The Harbor");
    CHECK(chapters->at(1).id == "02-storm");
    CHECK(chapters->at(1).title == "The Storm");
    CHECK(chapters->at(1).text == "The Storm\n\nRain fell. The wind rose.\n");

    CHECK(provider.bookId() == "narrator_book_list");
    std::filesystem::remove_all(dir);
}

TEST_CASE("DirectoryChapterProvider looks up a single chapter", "[chapters]")
{
    auto const dir = makeBook("narrator_book_lookup");
    auto provider = DirectoryChapterProvider(dir);

    auto const storm = provider.chapter("02-storm");
    REQUIRE(storm.has_value());
    CHECK(storm->title == "The Storm");

    auto const missing = provider.chapter("03-epilogue");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
    std::filesystem::remove_all(dir);
}

TEST_CASE("DirectoryChapterProvider reports a missing directory", "[chapters]")
{
    auto provider = DirectoryChapterProvider(std::filesystem::temp_directory_path() / "narrator_no_such_book");

    auto const chapters = provider.chapters();
    REQUIRE(!chapters.has_value());
    CHECK(chapters.error().code == ErrorCode::IoError);
}

TEST_CASE("DirectoryChapterProvider takes the book id from a trailing-slash path", "[chapters]")
{
    auto provider = DirectoryChapterProvider("/library/moby-dick/");
    CHECK(provider.bookId() == "moby-dick");
}
