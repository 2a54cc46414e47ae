// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <narrator/Config.hpp>

#include <filesystem>
#include <memory>

namespace narrator
{

/// @brief What to open when the application starts.
struct SessionOptions
{
    std::filesystem::path bookDirectory;
    BookId bookId;         ///< Storage key of the book; defaults to the directory name.
    std::string chapter;   ///< Chapter id or one-based chapter number; empty for the first chapter.
    int startSegment = 0;  ///< Zero-based segment to start at.
    bool autoPlay = true;
};

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param session The book and position to open.
    App(AppConfig config, SessionOptions session);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Initializes all components (voice catalog, book, audio device).
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the line-based command prompt until "quit" or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
