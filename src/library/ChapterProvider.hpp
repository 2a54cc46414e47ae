// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <vector>

namespace narrator
{

/// @brief Supplies the chapters of one book.
class ChapterProvider
{
  public:
    virtual ~ChapterProvider() = default;

    /// @brief Returns the book's identity, used as the storage key.
    [[nodiscard]] virtual auto bookId() const -> BookId = 0;

    /// @brief Returns all chapters in reading order.
    [[nodiscard]] virtual auto chapters() -> Result<std::vector<Chapter>> = 0;

    /// @brief Returns a single chapter, or a NotFound error.
    [[nodiscard]] virtual auto chapter(const ChapterId& id) -> Result<Chapter>;
};

/// @brief Reads a book from a directory of plain-text chapter files.
///
/// Every "*.txt" file is one chapter, ordered by file name. The chapter id is
/// the file stem and the title is the first non-empty line.
class DirectoryChapterProvider final: public ChapterProvider
{
  public:
    explicit DirectoryChapterProvider(std::filesystem::path directory);

    [[nodiscard]] auto bookId() const -> BookId override;
    [[nodiscard]] auto chapters() -> Result<std::vector<Chapter>> override;

  private:
    std::filesystem::path _directory;
};

} // namespace narrator
