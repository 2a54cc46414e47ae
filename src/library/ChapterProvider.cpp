// SPDX-License-Identifier: Apache-2.0
#include "ChapterProvider.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace narrator
{

namespace
{

    auto firstNonEmptyLine(std::string_view text) -> std::string
    {
        while (!text.empty())
        {
            auto const end = text.find('\n');
            auto line = text.substr(0, end);
            auto const first = line.find_first_not_of(" \t\r");
            if (first != std::string_view::npos)
            {
                auto const last = line.find_last_not_of(" \t\r");
                return std::string(line.substr(first, last - first + 1));
            }
            if (end == std::string_view::npos)
                break;
            text.remove_prefix(end + 1);
        }
        return {};
    }

} // namespace

auto ChapterProvider::chapter(const ChapterId& id) -> Result<Chapter>
{
    return chapters().and_then([&](std::vector<Chapter>&& all) -> Result<Chapter> {
        auto const it = std::ranges::find(all, id, &Chapter::id);
        if (it == all.end())
            return makeError(ErrorCode::NotFound, std::format("Chapter '{}' not found", id));
        return std::move(*it);
    });
}

DirectoryChapterProvider::DirectoryChapterProvider(std::filesystem::path directory): _directory(std::move(directory))
{
}

auto DirectoryChapterProvider::bookId() const -> BookId
{
    auto const normalized = _directory.lexically_normal();
    auto name = normalized.filename().string();
    if (name.empty())
        name = normalized.parent_path().filename().string();
    return name;
}

auto DirectoryChapterProvider::chapters() -> Result<std::vector<Chapter>>
{
    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot read book directory {}: {}", _directory.string(), ec.message()));

    auto files = std::vector<std::filesystem::path> {};
    for (auto const& entry: it)
        if (entry.is_regular_file() && entry.path().extension() == ".txt")
            files.push_back(entry.path());
    std::ranges::sort(files);

    auto result = std::vector<Chapter> {};
    result.reserve(files.size());
    for (auto const& path: files)
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open chapter file {}", path.string()));
        auto ss = std::stringstream {};
        ss << file.rdbuf();
        auto text = ss.str();
        auto title = firstNonEmptyLine(text);
        result.push_back(Chapter { .id = path.stem().string(), .title = std::move(title), .text = std::move(text) });
    }

    log::debug("Loaded {} chapter(s) from {}", result.size(), _directory.string());
    return result;
}

} // namespace narrator
