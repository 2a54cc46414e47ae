// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace narrator
{

namespace
{

    auto parseVoices(const nlohmann::json& voices) -> Result<std::vector<VoiceInfo>>
    {
        auto result = std::vector<VoiceInfo> {};
        if (!voices.is_array())
            return makeError(ErrorCode::ConfigError, "'voices' must be an array");

        for (auto const& entry: voices)
        {
            auto key = json::getString(entry, "key");
            if (!key)
                return std::unexpected(key.error());
            auto modelPath = json::getString(entry, "modelPath");
            if (!modelPath)
                return std::unexpected(modelPath.error());

            auto const qualityName = json::getStringOr(entry, "quality", "medium");
            auto const quality = parseVoiceQuality(qualityName);
            if (!quality)
                return makeError(ErrorCode::ConfigError,
                                 std::format("Voice '{}' has unknown quality '{}'", *key, qualityName));

            result.push_back(VoiceInfo {
                .key = std::move(*key),
                .language = json::getStringOr(entry, "language", "en"),
                .quality = *quality,
                .modelPath = std::move(*modelPath),
                .engine = json::getStringOr(entry, "engine", "piper"),
            });
        }
        return result;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\narrator";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/narrator";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/narrator";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/narrator";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\narrator";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/narrator";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/narrator";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/narrator";
    return ".";
#endif
}

auto defaultVoiceDir() -> std::string
{
    return defaultDataDir() + "/voices";
}

auto defaultStorageDir() -> std::string
{
    return defaultDataDir() + "/library";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto discoverVoices(const std::filesystem::path& directory) -> std::vector<VoiceInfo>
{
    auto voices = std::vector<VoiceInfo> {};
    auto ec = std::error_code {};
    for (auto const& entry: std::filesystem::directory_iterator(directory, ec))
    {
        auto const& path = entry.path();
        if (!entry.is_regular_file() || path.extension() != ".onnx")
            continue;

        // <language>-<name>-<quality>, e.g. en_US-lessac-medium
        auto const stem = path.stem().string();
        auto const first = stem.find('-');
        auto const last = stem.rfind('-');
        if (first == std::string::npos || first == last)
            continue;
        auto const quality = parseVoiceQuality(std::string_view(stem).substr(last + 1));
        if (!quality)
        {
            log::debug("Skipping voice file with unknown quality: {}", path.string());
            continue;
        }

        voices.push_back(VoiceInfo {
            .key = stem,
            .language = stem.substr(0, first),
            .quality = *quality,
            .modelPath = path.string(),
        });
    }
    if (ec)
        log::warning("Cannot scan voice directory {}: {}", directory.string(), ec.message());

    std::ranges::sort(voices, {}, &VoiceInfo::key);
    return voices;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    auto config = AppConfig {};

    // Engine section
    if (root.contains("engine"))
    {
        auto const& engine = root["engine"];
        config.engine.espeakDataPath = json::getStringOr(engine, "espeakDataPath", "");
        config.engine.voiceDirectory = json::getStringOr(engine, "voiceDirectory", "");
        config.engine.sampleRate = static_cast<unsigned>(json::getIntOr(engine, "sampleRate", 22050));
    }

    // Voice catalog
    if (root.contains("voices"))
    {
        auto voices = parseVoices(root["voices"]);
        if (!voices)
            return std::unexpected(voices.error());
        config.voices = std::move(*voices);
    }

    config.language = json::getStringOr(root, "language", "en");

    // Generation section
    if (root.contains("generation"))
    {
        auto const& generation = root["generation"];
        config.generation.timeoutSeconds = json::getDoubleOr(generation, "timeoutSeconds", 120.0);
        config.generation.maxInFlight = json::getIntOr(generation, "maxInFlight", 50);
        config.generation.maxRetries = json::getIntOr(generation, "maxRetries", 3);
        config.generation.initialDelayMs = json::getIntOr(generation, "initialDelayMs", 1000);
        config.generation.maxDelayMs = json::getIntOr(generation, "maxDelayMs", 5000);
        config.generation.backoffMultiplier = json::getDoubleOr(generation, "backoffMultiplier", 2.0);
    }

    // Buffer section
    if (root.contains("buffer"))
    {
        auto const& buffer = root["buffer"];
        config.buffer.lookahead = json::getIntOr(buffer, "lookahead", 5);
        config.buffer.evictTrail = json::getIntOr(buffer, "evictTrail", 5);
        config.buffer.maxParallelPrefetch = json::getIntOr(buffer, "maxParallelPrefetch", 5);
    }

    // Upgrade section
    if (root.contains("upgrade"))
    {
        auto const& upgrade = root["upgrade"];
        config.upgrade.enabled = json::getBoolOr(upgrade, "enabled", true);
        config.upgrade.startDelayMs = json::getIntOr(upgrade, "startDelayMs", 5000);
        config.upgrade.intervalMs = json::getIntOr(upgrade, "intervalMs", 5000);
        config.upgrade.horizon = json::getIntOr(upgrade, "horizon", 10);
        config.upgrade.upgradePlayed = json::getBoolOr(upgrade, "upgradePlayed", true);
    }

    // Resources section
    if (root.contains("resources"))
    {
        auto const& resources = root["resources"];
        config.resources.memoryFloorGb = json::getDoubleOr(resources, "memoryFloorGb", 2.0);
        config.resources.lowBatteryLevel = json::getDoubleOr(resources, "lowBatteryLevel", 0.2);
        config.resources.maxMemoryUtilization = json::getDoubleOr(resources, "maxMemoryUtilization", 0.8);
        config.resources.deviceClass = json::getStringOr(resources, "deviceClass", "");
    }

    // Playback section
    if (root.contains("playback"))
    {
        auto const& playback = root["playback"];
        config.playback.speed = json::getDoubleOr(playback, "speed", 1.0);
        config.playback.wordsPerMinute = json::getDoubleOr(playback, "wordsPerMinute", 160.0);
    }

    if (root.contains("storage"))
        config.storageDirectory = json::getStringOr(root["storage"], "directory", "");

    if (root.contains("log"))
        config.logLevel = json::getStringOr(root["log"], "level", "info");

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Engine section
    auto engine = nlohmann::json::object();
    if (!config.engine.espeakDataPath.empty())
        engine["espeakDataPath"] = config.engine.espeakDataPath;
    if (!config.engine.voiceDirectory.empty())
        engine["voiceDirectory"] = config.engine.voiceDirectory;
    engine["sampleRate"] = config.engine.sampleRate;
    root["engine"] = std::move(engine);

    // Voice catalog
    auto voices = nlohmann::json::array();
    for (auto const& voice: config.voices)
    {
        voices.push_back({
            { "key", voice.key },
            { "language", voice.language },
            { "quality", std::string(voiceQualityToString(voice.quality)) },
            { "modelPath", voice.modelPath },
            { "engine", voice.engine },
        });
    }
    root["voices"] = std::move(voices);
    root["language"] = config.language;

    // Generation section
    auto generation = nlohmann::json::object();
    generation["timeoutSeconds"] = config.generation.timeoutSeconds;
    generation["maxInFlight"] = config.generation.maxInFlight;
    generation["maxRetries"] = config.generation.maxRetries;
    generation["initialDelayMs"] = config.generation.initialDelayMs;
    generation["maxDelayMs"] = config.generation.maxDelayMs;
    generation["backoffMultiplier"] = config.generation.backoffMultiplier;
    root["generation"] = std::move(generation);

    // Buffer section
    auto buffer = nlohmann::json::object();
    buffer["lookahead"] = config.buffer.lookahead;
    buffer["evictTrail"] = config.buffer.evictTrail;
    buffer["maxParallelPrefetch"] = config.buffer.maxParallelPrefetch;
    root["buffer"] = std::move(buffer);

    // Upgrade section
    auto upgrade = nlohmann::json::object();
    upgrade["enabled"] = config.upgrade.enabled;
    upgrade["startDelayMs"] = config.upgrade.startDelayMs;
    upgrade["intervalMs"] = config.upgrade.intervalMs;
    upgrade["horizon"] = config.upgrade.horizon;
    upgrade["upgradePlayed"] = config.upgrade.upgradePlayed;
    root["upgrade"] = std::move(upgrade);

    // Resources section
    auto resources = nlohmann::json::object();
    resources["memoryFloorGb"] = config.resources.memoryFloorGb;
    resources["lowBatteryLevel"] = config.resources.lowBatteryLevel;
    resources["maxMemoryUtilization"] = config.resources.maxMemoryUtilization;
    if (!config.resources.deviceClass.empty())
        resources["deviceClass"] = config.resources.deviceClass;
    root["resources"] = std::move(resources);

    // Playback section
    auto playback = nlohmann::json::object();
    playback["speed"] = config.playback.speed;
    playback["wordsPerMinute"] = config.playback.wordsPerMinute;
    root["playback"] = std::move(playback);

    auto storage = nlohmann::json::object();
    if (!config.storageDirectory.empty())
        storage["directory"] = config.storageDirectory;
    root["storage"] = std::move(storage);

    root["log"] = { { "level", config.logLevel } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const fail = [](std::string message) {
        return makeError(ErrorCode::ConfigError, std::move(message));
    };

    if (config.generation.timeoutSeconds <= 0.0)
        return fail("generation.timeoutSeconds must be positive");
    if (config.generation.maxInFlight < 1)
        return fail("generation.maxInFlight must be at least 1");
    if (config.generation.maxRetries < 0)
        return fail("generation.maxRetries must not be negative");
    if (config.generation.initialDelayMs < 0 || config.generation.maxDelayMs < config.generation.initialDelayMs)
        return fail("generation delays must satisfy 0 <= initialDelayMs <= maxDelayMs");
    if (config.generation.backoffMultiplier < 1.0)
        return fail("generation.backoffMultiplier must be at least 1");
    if (config.buffer.lookahead < 0 || config.buffer.evictTrail < 0)
        return fail("buffer.lookahead and buffer.evictTrail must not be negative");
    if (config.buffer.maxParallelPrefetch < 1)
        return fail("buffer.maxParallelPrefetch must be at least 1");
    if (config.upgrade.startDelayMs < 0 || config.upgrade.intervalMs <= 0)
        return fail("upgrade.intervalMs must be positive and upgrade.startDelayMs not negative");
    if (config.upgrade.horizon < 1)
        return fail("upgrade.horizon must be at least 1");
    if (!config.resources.deviceClass.empty() && !parseDeviceClass(config.resources.deviceClass))
        return fail(std::format("Unknown resources.deviceClass '{}'", config.resources.deviceClass));
    if (config.playback.speed < PlaybackController::MinSpeed || config.playback.speed > PlaybackController::MaxSpeed)
        return fail(std::format("playback.speed must be within [{}, {}]",
                                PlaybackController::MinSpeed,
                                PlaybackController::MaxSpeed));
    if (config.playback.wordsPerMinute <= 0.0)
        return fail("playback.wordsPerMinute must be positive");
    if (config.engine.sampleRate == 0)
        return fail("engine.sampleRate must be positive");
    if (!log::parseLevel(config.logLevel))
        return fail(std::format("Unknown log level '{}'", config.logLevel));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toCoordinatorOptions(const GenerationConfig& config) -> CoordinatorOptions
{
    return CoordinatorOptions {
        .requestTimeout = std::chrono::milliseconds(static_cast<long long>(config.timeoutSeconds * 1000.0)),
        .maxInFlight = static_cast<std::size_t>(config.maxInFlight),
        .maxRetries = config.maxRetries,
        .initialDelay = std::chrono::milliseconds(config.initialDelayMs),
        .maxDelay = std::chrono::milliseconds(config.maxDelayMs),
        .backoffMultiplier = config.backoffMultiplier,
    };
}

auto toBufferOptions(const BufferConfig& config) -> BufferOptions
{
    return BufferOptions {
        .lookahead = config.lookahead,
        .evictTrail = config.evictTrail,
        .maxParallelPrefetch = static_cast<std::size_t>(config.maxParallelPrefetch),
    };
}

auto toSchedulerOptions(const UpgradeConfig& config) -> SchedulerOptions
{
    return SchedulerOptions {
        .startDelay = std::chrono::milliseconds(config.startDelayMs),
        .interval = std::chrono::milliseconds(config.intervalMs),
        .horizon = config.horizon,
        .upgradePlayed = config.upgradePlayed,
    };
}

auto toResourceThresholds(const ResourcesConfig& config) -> ResourceThresholds
{
    auto thresholds = ResourceThresholds {};
    thresholds.memoryFloorGb = config.memoryFloorGb;
    thresholds.lowBatteryLevel = config.lowBatteryLevel;
    thresholds.maxMemoryUtilization = config.maxMemoryUtilization;
    if (!config.deviceClass.empty())
        thresholds.deviceClassOverride = parseDeviceClass(config.deviceClass);
    return thresholds;
}

auto toPlaybackOptions(const AppConfig& config) -> PlaybackOptions
{
    return PlaybackOptions {
        .buffer = toBufferOptions(config.buffer),
        .speed = config.playback.speed,
        .wordsPerMinute = config.playback.wordsPerMinute,
    };
}

} // namespace narrator
