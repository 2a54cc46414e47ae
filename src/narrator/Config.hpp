// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/AdaptiveQualityScheduler.hpp>
#include <pipeline/PlaybackController.hpp>
#include <pipeline/ResourceMonitor.hpp>
#include <tts/GenerationCoordinator.hpp>
#include <tts/TierLadder.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Speech engine configuration section.
struct EngineConfig
{
    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;

    /// @brief Directory scanned for piper voices when the catalog is empty.
    std::string voiceDirectory;

    /// @brief Sample rate the audio device is opened with.
    unsigned sampleRate = 22050;
};

/// @brief Generation coordinator section.
struct GenerationConfig
{
    double timeoutSeconds = 120.0;
    int maxInFlight = 50;
    int maxRetries = 3;
    int initialDelayMs = 1000;
    int maxDelayMs = 5000;
    double backoffMultiplier = 2.0;
};

/// @brief Playback buffer section.
struct BufferConfig
{
    int lookahead = 5;
    int evictTrail = 5;
    int maxParallelPrefetch = 5;
};

/// @brief Background quality upgrade section.
struct UpgradeConfig
{
    bool enabled = true;
    int startDelayMs = 5000;
    int intervalMs = 5000;
    int horizon = 10;
    bool upgradePlayed = true;
};

/// @brief Resource gate section.
struct ResourcesConfig
{
    double memoryFloorGb = 2.0;
    double lowBatteryLevel = 0.2;
    double maxMemoryUtilization = 0.8;

    /// @brief Forces a device class ("weak", "medium", "strong"); empty to detect.
    std::string deviceClass;
};

/// @brief Playback section.
struct PlaybackConfig
{
    double speed = 1.0;
    double wordsPerMinute = 160.0;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    EngineConfig engine;
    std::vector<VoiceInfo> voices;
    std::string language = "en";
    GenerationConfig generation;
    BufferConfig buffer;
    UpgradeConfig upgrade;
    ResourcesConfig resources;
    PlaybackConfig playback;

    /// @brief Root of the segment store; empty for the default data directory.
    std::string storageDirectory;

    /// @brief Log level name ("error", "warning", "info", "debug", "trace").
    std::string logLevel = "info";
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Rejects values the pipeline cannot run with.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/narrator or ~/.local/share/narrator
/// On macOS: ~/Library/Application Support/narrator
/// On Windows: %APPDATA%\narrator
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default directory scanned for voice models.
[[nodiscard]] auto defaultVoiceDir() -> std::string;

/// @brief Returns the default segment store directory.
[[nodiscard]] auto defaultStorageDir() -> std::string;

/// @brief Builds catalog entries from piper model files named "<lang>-<name>-<quality>.onnx".
///
/// Files that do not follow the naming scheme are skipped.
[[nodiscard]] auto discoverVoices(const std::filesystem::path& directory) -> std::vector<VoiceInfo>;

[[nodiscard]] auto toCoordinatorOptions(const GenerationConfig& config) -> CoordinatorOptions;
[[nodiscard]] auto toBufferOptions(const BufferConfig& config) -> BufferOptions;
[[nodiscard]] auto toSchedulerOptions(const UpgradeConfig& config) -> SchedulerOptions;
[[nodiscard]] auto toResourceThresholds(const ResourcesConfig& config) -> ResourceThresholds;
[[nodiscard]] auto toPlaybackOptions(const AppConfig& config) -> PlaybackOptions;

} // namespace narrator
