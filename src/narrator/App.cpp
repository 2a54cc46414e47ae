// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MiniaudioOutput.hpp>
#include <core/Log.hpp>
#include <library/ChapterProvider.hpp>
#include <library/FileSegmentStore.hpp>
#include <narrator/MediaSession.hpp>
#include <pipeline/AdaptiveQualityScheduler.hpp>
#include <pipeline/PlaybackController.hpp>
#include <pipeline/ResourceMonitor.hpp>
#include <pipeline/SegmentProgressTracker.hpp>
#include <pipeline/HostInfo.hpp>
#include <text/SegmentSplitter.hpp>
#include <tts/GenerationCoordinator.hpp>
#include <tts/PiperEngine.hpp>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <iostream>
#include <print>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace narrator
{

namespace
{
    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  play | pause | toggle (p)      control playback\n"
        "  next (n) | previous (b)        skip one segment\n"
        "  seek <n>                       jump to segment n\n"
        "  speed <rate>                   set the playback rate (0.25 - 4)\n"
        "  chapter <n> | chapters         open chapter n / list chapters\n"
        "  status (s) | stop | help | quit\n"
    };
} // namespace

struct App::Impl
{
    AppConfig config;
    SessionOptions sessionOptions;

    LinuxHostInfo host;
    ResourceMonitor monitor;
    PiperEngine engine;
    GenerationCoordinator coordinator;
    FileSegmentStore store;
    SegmentProgressTracker progress;
    DirectoryChapterProvider provider;
    MiniaudioOutput output;

    // Destroyed before the components above; the scheduler goes first since its
    // callbacks reach into the controller.
    std::unique_ptr<PlaybackController> controller;
    std::unique_ptr<AdaptiveQualityScheduler> scheduler;
    std::unique_ptr<MediaSession> session;

    BookId book;
    std::vector<Chapter> chapters;
    TierLadder ladder;
    std::size_t chapterPosition = 0;
    ChapterId openChapterId;

    Impl(AppConfig cfg, SessionOptions options):
        config(std::move(cfg)),
        sessionOptions(std::move(options)),
        monitor(host, toResourceThresholds(config.resources)),
        engine(PiperEngineConfig { .espeakDataPath = config.engine.espeakDataPath }),
        coordinator(engine, toCoordinatorOptions(config.generation)),
        store(config.storageDirectory.empty() ? defaultStorageDir() : config.storageDirectory),
        provider(sessionOptions.bookDirectory)
    {
    }

    /// @brief Resolves the voice catalog and the tier ladder for the configured language.
    auto initializeVoices() -> VoidResult
    {
        if (config.voices.empty())
        {
            auto const directory = config.engine.voiceDirectory.empty() ? defaultVoiceDir()
                                                                        : config.engine.voiceDirectory;
            config.voices = discoverVoices(directory);
            log::info("Found {} voice model(s) in {}", config.voices.size(), directory);
        }

        auto resolved = resolveTierLadder(config.language, config.voices);
        if (!resolved)
            return std::unexpected(resolved.error());
        ladder = std::move(*resolved);

        for (auto tier = 0; tier <= ladder.maxAvailableTier; ++tier)
            if (auto const* voice = ladder.at(tier))
                log::info("Tier {}: {}", tier, voice->voice);
        return {};
    }

    /// @brief Returns the chapter position named by a chapter id or one-based number.
    [[nodiscard]] auto findChapter(std::string_view name) const -> std::optional<std::size_t>
    {
        auto const byId = std::ranges::find(chapters, name, &Chapter::id);
        if (byId != chapters.end())
            return static_cast<std::size_t>(byId - chapters.begin());

        auto number = 0;
        auto const [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), number);
        if (ec == std::errc {} && ptr == name.data() + name.size() && number >= 1
            && static_cast<std::size_t>(number) <= chapters.size())
            return static_cast<std::size_t>(number - 1);
        return std::nullopt;
    }

    void closeChapter()
    {
        if (openChapterId.empty())
            return;
        scheduler->cancelFastPass(openChapterId);
        scheduler->cancelUpgrade(openChapterId);
        controller->stop();
        coordinator.cancelAll();
        progress.clearChapter(openChapterId);
        openChapterId.clear();
    }

    /// @brief Starts tracking a chapter, reusing whatever stored audio still matches its text.
    void prepareProgress(const ChapterId& id, std::span<const Segment> segments)
    {
        auto restored = progress.loadFromStore(store, book, id, segments);
        if (!restored)
        {
            log::warning("Cannot read stored segments of {}: {}", id, restored.error());
            progress.initChapter(id, segments);
        }
        else if (*restored > 0 && *restored < static_cast<int>(segments.size()))
            log::info("Generating the {} missing segment(s) of {}", segments.size() - *restored, id);
    }

    void scheduleUpgrades(const ChapterId& id)
    {
        if (!config.upgrade.enabled)
            return;
        (void) scheduler->scheduleUpgradePass(
            book,
            id,
            ladder,
            [this] { return controller->currentIndex(); },
            [this](const ChapterId& chapter, const Segment& segment) {
                controller->onSegmentUpgraded(chapter, segment);
            });
    }

    auto openChapter(std::size_t position, int startSegment, bool autoPlay) -> VoidResult
    {
        closeChapter();

        auto const& chapter = chapters[position];
        auto segments = splitIntoSegments(chapter.text);
        if (segments.empty())
            return makeError(ErrorCode::InvalidInput, std::format("Chapter '{}' has no speakable text", chapter.title));

        auto const tier = ladder.lowestFrom(monitor.startingTier());
        if (!tier)
            return makeError(ErrorCode::UnsupportedVoice, std::format("No voice for language '{}'", config.language));

        chapterPosition = position;
        openChapterId = chapter.id;
        prepareProgress(chapter.id, segments);

        session->setMetadata(MediaMetadata {
            .book = book,
            .chapter = chapter.title,
            .segmentCount = static_cast<int>(segments.size()),
        });
        controller->loadChapter(book,
                                chapter.id,
                                segments,
                                GenerationTarget { .voice = *ladder.at(*tier), .tier = *tier },
                                startSegment);

        auto started = scheduler->startFastPass(
            book,
            chapter.id,
            std::move(segments),
            ladder,
            [this](const ChapterId& id, const Segment& segment) { controller->onSegmentGenerated(id, segment); });
        if (!started)
            return std::unexpected(started.error());
        scheduleUpgrades(chapter.id);

        log::info("Opened chapter {} of {}: {}", position + 1, chapters.size(), chapter.title);
        if (autoPlay)
            controller->play();
        return {};
    }

    void listChapters() const
    {
        for (auto i = std::size_t { 0 }; i < chapters.size(); ++i)
            std::println("  {}{:>3}  {}", i == chapterPosition ? '*' : ' ', i + 1, chapters[i].title);
    }

    /// @brief Handles one prompt line.
    /// @return False when the user asked to quit.
    auto handleLine(std::string_view line) -> bool
    {
        if (line == "quit" || line == "q" || line == "exit")
            return false;

        if (line == "help" || line == "?")
        {
            std::print("{}", HelpText);
            return true;
        }

        if (line == "chapters")
        {
            listChapters();
            return true;
        }

        if (line.starts_with("chapter "))
        {
            auto const name = line.substr(8);
            auto const position = findChapter(name);
            if (!position)
                std::println("No such chapter: {}", name);
            else if (auto opened = openChapter(*position, 0, true); !opened)
                std::println("Cannot open chapter: {}", opened.error().message);
            return true;
        }

        auto command = parseMediaCommand(line);
        if (!command)
        {
            std::println("{} (type 'help' for commands)", command.error().message);
            return true;
        }

        session->execute(*command);
        controller->sync();
        std::println("{}", session->renderStatus());
        return true;
    }
};

App::App(AppConfig config, SessionOptions session):
    _impl(std::make_unique<Impl>(std::move(config), std::move(session)))
{
}

App::~App()
{
    if (_impl->scheduler)
        _impl->scheduler->cancelAll();
    if (_impl->controller)
        _impl->controller->stop();
    _impl->coordinator.shutdown();
}

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    if (auto voices = impl.initializeVoices(); !voices)
        return voices;

    auto chapters = impl.provider.chapters();
    if (!chapters)
        return std::unexpected(chapters.error());
    if (chapters->empty())
        return makeError(ErrorCode::NotFound,
                         std::format("No chapters found in {}", impl.sessionOptions.bookDirectory.string()));
    impl.chapters = std::move(*chapters);
    impl.book = impl.sessionOptions.bookId.empty() ? impl.provider.bookId() : impl.sessionOptions.bookId;
    log::info("Book '{}' with {} chapter(s)", impl.book, impl.chapters.size());

    if (auto device = impl.output.initialize(impl.config.engine.sampleRate); !device)
        return device;

    log::info("Device class: {}, upgrade target tier {}",
              deviceClassToString(impl.monitor.classifyDevice()),
              impl.monitor.targetTier());

    impl.progress.setListener([](const ChapterId& chapter, int percentage) {
        log::debug("Chapter {} generated: {}%", chapter, percentage);
    });

    impl.controller = std::make_unique<PlaybackController>(
        impl.coordinator, impl.progress, impl.store, impl.output, toPlaybackOptions(impl.config));
    impl.scheduler = std::make_unique<AdaptiveQualityScheduler>(
        impl.coordinator, impl.monitor, impl.progress, impl.store, toSchedulerOptions(impl.config.upgrade));
    impl.session = std::make_unique<MediaSession>(*impl.controller);

    impl.controller->setListener([&impl](const PlaybackEvent& event) {
        impl.session->observe(event);
        if (auto const* error = std::get_if<PlaybackErrorEvent>(&event))
            std::println("Playback stopped: {}", error->error.message);
        else if (auto const* state = std::get_if<StateChangedEvent>(&event);
                 state && state->state == PlaybackState::Ended)
            std::println("End of chapter. Type 'chapter {}' to continue.", impl.chapterPosition + 2);
    });

    // Auto-create config file with resolved settings if none exists
    auto const configPath = defaultConfigPath();
    if (!std::filesystem::exists(configPath))
    {
        auto saveResult = saveConfigToFile(configPath, impl.config);
        if (saveResult)
            log::info("Config file created at {}", configPath);
        else
            log::warning("Failed to save config file: {}", saveResult.error().message);
    }

    log::info("Application initialized successfully");
    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;

    auto position = std::size_t { 0 };
    if (!impl.sessionOptions.chapter.empty())
    {
        auto const found = impl.findChapter(impl.sessionOptions.chapter);
        if (!found)
        {
            log::error("No chapter '{}' in {}", impl.sessionOptions.chapter, impl.book);
            return 1;
        }
        position = *found;
    }

    if (auto opened = impl.openChapter(position, impl.sessionOptions.startSegment, impl.sessionOptions.autoPlay);
        !opened)
    {
        log::error("Cannot open chapter: {}", opened.error().message);
        return 1;
    }

    std::print("{}", HelpText);
    auto line = std::string {};
    while (true)
    {
        std::print("> ");
        std::cout.flush();
        if (!std::getline(std::cin, line))
            break;
        if (!impl.handleLine(line))
            break;
    }

    impl.closeChapter();
    return 0;
}

} // namespace narrator
