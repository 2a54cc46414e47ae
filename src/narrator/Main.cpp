// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <narrator/App.hpp>
#include <narrator/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "narrator: audiobook player with progressive speech synthesis" };

    auto bookDirectory = std::string {};
    auto configPath = std::string {};
    auto chapter = std::string {};
    auto bookId = std::string {};
    auto language = std::string {};
    auto speed = 0.0;
    auto startSegment = 0;
    auto noUpgrade = false;
    auto paused = false;
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("book", bookDirectory, "Directory of chapter text files")->required()->check(CLI::ExistingDirectory);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--chapter", chapter, "Chapter id or number to open");
    app.add_option("--book-id", bookId, "Storage key of the book (defaults to the directory name)");
    app.add_option("--language", language, "Language of the book (e.g. en, de_DE)");
    app.add_option("--speed", speed, "Playback speed")->check(CLI::Range(0.25, 4.0));
    app.add_option("--start-segment", startSegment, "One-based segment to start at")->check(CLI::PositiveNumber);
    app.add_flag("--no-upgrade", noUpgrade, "Keep the fast-pass quality, no background upgrades");
    app.add_flag("--paused", paused, "Open the chapter without starting playback");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? narrator::loadConfig() : narrator::loadConfigFromFile(configPath);

    if (!configResult)
    {
        narrator::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!language.empty())
        config.language = language;
    if (speed > 0.0)
        config.playback.speed = speed;
    if (noUpgrade)
        config.upgrade.enabled = false;
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (verbose)
        config.logLevel = "debug";

    auto const level = narrator::log::parseLevel(config.logLevel);
    if (!level)
    {
        narrator::log::error("Unknown log level: {}", config.logLevel);
        return 1;
    }
    narrator::log::setLevel(*level);

    auto session = narrator::SessionOptions {
        .bookDirectory = bookDirectory,
        .bookId = bookId,
        .chapter = chapter,
        .startSegment = startSegment > 0 ? startSegment - 1 : 0,
        .autoPlay = !paused,
    };

    auto application = narrator::App(std::move(config), std::move(session));
    auto initResult = application.initialize();
    if (!initResult)
    {
        narrator::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
